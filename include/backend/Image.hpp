#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace maestro::backend {

enum class ImageFormat { Png, Jpeg };

// Extension written for cache files: "png" or "jpg"
std::string_view extension(ImageFormat format);
std::string_view mime_type(ImageFormat format);

// Sniffs PNG / JPEG signatures
std::optional<ImageFormat> detect_format(const std::vector<uint8_t>& data);

struct Image {
    std::vector<uint8_t> data;  // Encoded bytes
    ImageFormat format = ImageFormat::Jpeg;

    std::string_view mime_type() const { return backend::mime_type(format); }

    bool operator==(const Image&) const = default;
};

class CoverError : public std::runtime_error {
public:
    enum class Kind {
        CacheRead,       // cached file exists but can't be read or isn't an image
        SourceRead,      // source image exists but can't be read
        Decode,          // source image can't be decoded
        Encode,          // transformed image can't be encoded
        NoCodec,         // a source needs transforming but no codec is configured
        CreateCacheDir,
        WriteCache
    };

    CoverError(Kind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

}  // namespace maestro::backend
