#pragma once

#include "backend/Image.hpp"
#include "backend/ImageCodec.hpp"
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

namespace maestro::test {

// Unique scratch directory, removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        auto base = std::filesystem::temp_directory_path();
        for (int attempt = 0; attempt < 100; ++attempt) {
            auto candidate = base / ("maestro-test-" + std::to_string(::getpid()) + "-" + std::to_string(rd()));
            if (std::filesystem::create_directory(candidate)) {
                path_ = candidate;
                return;
            }
        }
        throw std::runtime_error("couldn't create temp dir");
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

inline void write_file(const std::filesystem::path& path, const std::string& text) {
    write_file(path, std::vector<uint8_t>(text.begin(), text.end()));
}

inline std::vector<uint8_t> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline std::vector<uint8_t> png_bytes(size_t size, uint8_t fill = 0) {
    std::vector<uint8_t> data = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    data.resize(std::max(size, data.size()), fill);
    return data;
}

inline std::vector<uint8_t> jpeg_bytes(size_t size, uint8_t fill = 0) {
    std::vector<uint8_t> data = {0xFF, 0xD8, 0xFF, 0xE0};
    data.resize(std::max(size, data.size()), fill);
    return data;
}

// Codec stand-in that counts calls. Sources whose first byte is 'X' fail to
// decode; any other bytes decode to a 400x200 image. Encoders emit a valid
// signature padded to the configured sizes.
class FakeCodec : public backend::ImageCodec {
public:
    size_t png_size = 100;
    size_t jpeg_size = 200;

    mutable std::atomic<int> decodes{0};
    mutable std::atomic<int> last_box{0};
    mutable std::vector<uint8_t> last_source;

    backend::Pixels decode(const std::vector<uint8_t>& encoded) const override {
        ++decodes;
        last_source = encoded;
        if (encoded.empty() || encoded[0] == 'X') {
            throw backend::CoverError(backend::CoverError::Kind::Decode, "fake decode failure");
        }
        backend::Pixels pixels;
        pixels.width = 400;
        pixels.height = 200;
        pixels.data.assign(400 * 200 * 3, 0);
        return pixels;
    }

    backend::Pixels resize(const backend::Pixels& pixels, int box_w, int box_h) const override {
        last_box = box_w;
        auto [w, h] = backend::fit_within(pixels.width, pixels.height, box_w, box_h);
        backend::Pixels out;
        out.width = w;
        out.height = h;
        out.data.assign(static_cast<size_t>(w) * h * 3, 0);
        return out;
    }

    std::vector<uint8_t> encode_png(const backend::Pixels&) const override {
        return png_bytes(png_size);
    }

    std::vector<uint8_t> encode_jpeg(const backend::Pixels&, int) const override {
        return jpeg_bytes(jpeg_size);
    }
};

}  // namespace maestro::test
