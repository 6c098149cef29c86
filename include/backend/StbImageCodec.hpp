#pragma once

#include "backend/ImageCodec.hpp"

namespace maestro::backend {

// ImageCodec on stb_image / stb_image_resize2 / stb_image_write
class StbImageCodec : public ImageCodec {
public:
    Pixels decode(const std::vector<uint8_t>& encoded) const override;
    Pixels resize(const Pixels& pixels, int box_w, int box_h) const override;
    std::vector<uint8_t> encode_png(const Pixels& pixels) const override;
    std::vector<uint8_t> encode_jpeg(const Pixels& pixels, int quality) const override;
};

}  // namespace maestro::backend
