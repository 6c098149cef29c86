#pragma once

#include "backend/Image.hpp"
#include "backend/ImageCodec.hpp"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace maestro::backend {

enum class CoverVariant { Standard, CarSafe };

struct CoverSettings {
    int size = 1000;        // Standard covers fit in size x size
    int size_vw = 300;      // Car-safe covers fit in size_vw x size_vw
    int jpeg_quality = 75;
};

/**
 * Cached cover lookup.
 *
 * load_with_cache() probes <cache>/<name>.{png,jpg,jpeg} first and returns a
 * hit unchanged. Otherwise it probes <images>/<name>.{png,jpg,jpeg}, transforms
 * the first hit, writes it to <cache>/<name>.<ext of the chosen format> and
 * returns it. No image in either place is not an error.
 *
 * Stateless apart from the codec; safe to share between album views.
 */
class CoverResolver {
public:
    explicit CoverResolver(std::shared_ptr<const ImageCodec> codec, CoverSettings settings = {});

    std::optional<Image> load_with_cache(const std::filesystem::path& images_dir,
                                         const std::filesystem::path& cache_dir,
                                         const std::string& name,
                                         CoverVariant variant) const;

    // Standard: PNG or JPEG, whichever encodes smaller (PNG on a tie).
    // CarSafe: always JPEG.
    Image transform(const std::vector<uint8_t>& source, CoverVariant variant) const;

    const CoverSettings& settings() const { return settings_; }

private:
    static std::optional<std::filesystem::path> probe(const std::filesystem::path& dir,
                                                      const std::string& name);

    std::shared_ptr<const ImageCodec> codec_;
    CoverSettings settings_;
};

}  // namespace maestro::backend
