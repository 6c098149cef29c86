#pragma once

#include <algorithm>
#include <cstdint>
#include <utility>
#include <vector>

namespace maestro::backend {

// Interleaved 8-bit pixels
struct Pixels {
    int width = 0;
    int height = 0;
    int channels = 3;
    std::vector<uint8_t> data;
};

// Pixel-level operations used by the cover resolver.
// Implementations throw CoverError (Decode / Encode) on failure.
class ImageCodec {
public:
    virtual ~ImageCodec() = default;

    // Decodes PNG or JPEG bytes to RGB (alpha is dropped)
    virtual Pixels decode(const std::vector<uint8_t>& encoded) const = 0;

    // Scales to fit inside box_w x box_h, keeping the aspect ratio
    virtual Pixels resize(const Pixels& pixels, int box_w, int box_h) const = 0;

    virtual std::vector<uint8_t> encode_png(const Pixels& pixels) const = 0;
    virtual std::vector<uint8_t> encode_jpeg(const Pixels& pixels, int quality) const = 0;
};

// Largest size with the source's aspect ratio that fits in the box; each side >= 1
inline std::pair<int, int> fit_within(int w, int h, int box_w, int box_h) {
    if (w <= 0 || h <= 0) return {1, 1};
    double scale = std::min(static_cast<double>(box_w) / w, static_cast<double>(box_h) / h);
    int out_w = std::max(1, std::min(static_cast<int>(w * scale + 0.5), box_w));
    int out_h = std::max(1, std::min(static_cast<int>(h * scale + 0.5), box_h));
    return {out_w, out_h};
}

}  // namespace maestro::backend
