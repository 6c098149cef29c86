#include "backend/StbImageCodec.hpp"
#include "backend/Image.hpp"
#include "util/Logger.hpp"

// stb_image for decoding
#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_JPEG
#define STBI_ONLY_PNG
#include "stb/stb_image.h"

#define STB_IMAGE_RESIZE_IMPLEMENTATION
#include "stb/stb_image_resize2.h"

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb/stb_image_write.h"
#pragma GCC diagnostic pop

namespace maestro::backend {

namespace {

void append_to_vector(void* context, void* data, int size) {
    auto* out = static_cast<std::vector<uint8_t>*>(context);
    auto* bytes = static_cast<const uint8_t*>(data);
    out->insert(out->end(), bytes, bytes + size);
}

void check_pixels(const Pixels& pixels) {
    if (pixels.width <= 0 || pixels.height <= 0 ||
        pixels.data.size() < static_cast<size_t>(pixels.width) * pixels.height * pixels.channels) {
        throw CoverError(CoverError::Kind::Encode, "invalid pixel buffer");
    }
}

}  // namespace

Pixels StbImageCodec::decode(const std::vector<uint8_t>& encoded) const {
    int w, h, channels;
    unsigned char* pixels = stbi_load_from_memory(
        encoded.data(), static_cast<int>(encoded.size()),
        &w, &h, &channels, 3
    );

    if (!pixels) {
        const char* reason = stbi_failure_reason();
        throw CoverError(CoverError::Kind::Decode,
                         std::string("couldn't decode image: ") + (reason ? reason : "unknown error"));
    }

    Pixels result;
    result.width = w;
    result.height = h;
    result.channels = 3;
    result.data.assign(pixels, pixels + static_cast<size_t>(w) * h * 3);
    stbi_image_free(pixels);

    util::Logger::debug("StbImageCodec: Decoded " + std::to_string(w) + "x" + std::to_string(h));
    return result;
}

Pixels StbImageCodec::resize(const Pixels& pixels, int box_w, int box_h) const {
    check_pixels(pixels);

    auto [target_w, target_h] = fit_within(pixels.width, pixels.height, box_w, box_h);

    Pixels result;
    result.width = target_w;
    result.height = target_h;
    result.channels = pixels.channels;
    result.data.resize(static_cast<size_t>(target_w) * target_h * pixels.channels);

    void* ok = stbir_resize(pixels.data.data(), pixels.width, pixels.height, 0,
                            result.data.data(), target_w, target_h, 0,
                            (pixels.channels == 4 ? STBIR_RGBA : STBIR_RGB),
                            STBIR_TYPE_UINT8, STBIR_EDGE_CLAMP, STBIR_FILTER_MITCHELL);
    if (!ok) {
        throw CoverError(CoverError::Kind::Encode, "couldn't resize image");
    }
    return result;
}

std::vector<uint8_t> StbImageCodec::encode_png(const Pixels& pixels) const {
    check_pixels(pixels);

    std::vector<uint8_t> out;
    int ok = stbi_write_png_to_func(append_to_vector, &out, pixels.width, pixels.height,
                                    pixels.channels, pixels.data.data(),
                                    pixels.width * pixels.channels);
    if (!ok || out.empty()) {
        throw CoverError(CoverError::Kind::Encode, "couldn't encode PNG");
    }
    return out;
}

std::vector<uint8_t> StbImageCodec::encode_jpeg(const Pixels& pixels, int quality) const {
    check_pixels(pixels);

    std::vector<uint8_t> out;
    int ok = stbi_write_jpg_to_func(append_to_vector, &out, pixels.width, pixels.height,
                                    pixels.channels, pixels.data.data(), quality);
    if (!ok || out.empty()) {
        throw CoverError(CoverError::Kind::Encode, "couldn't encode JPEG");
    }
    return out;
}

}  // namespace maestro::backend
