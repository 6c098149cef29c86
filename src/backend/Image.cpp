#include "backend/Image.hpp"
#include <algorithm>
#include <iterator>

namespace maestro::backend {

std::string_view extension(ImageFormat format) {
    switch (format) {
        case ImageFormat::Png: return "png";
        case ImageFormat::Jpeg: return "jpg";
    }
    return "jpg";
}

std::string_view mime_type(ImageFormat format) {
    switch (format) {
        case ImageFormat::Png: return "image/png";
        case ImageFormat::Jpeg: return "image/jpeg";
    }
    return "image/jpeg";
}

std::optional<ImageFormat> detect_format(const std::vector<uint8_t>& data) {
    static const uint8_t PNG_SIGNATURE[] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};

    if (data.size() >= sizeof(PNG_SIGNATURE) &&
        std::equal(std::begin(PNG_SIGNATURE), std::end(PNG_SIGNATURE), data.begin())) {
        return ImageFormat::Png;
    }
    if (data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) {
        return ImageFormat::Jpeg;
    }
    return std::nullopt;
}

}  // namespace maestro::backend
