#pragma once

#include "backend/Image.hpp"
#include <cstddef>
#include <optional>
#include <string>

namespace maestro::backend {

// Flattened per-track tag values, ready for the ID3 writer.
// Absent optionals mean the frame must not be present.
struct TagData {
    std::string title;
    std::optional<std::string> artist;
    std::optional<std::string> album_artist;
    size_t track_number = 0;
    std::optional<size_t> disc_number;  // only on multi-disc albums
    std::string album;
    std::optional<int> year;
    std::optional<std::string> genre;
    std::optional<std::string> comment;
    std::optional<std::string> lyrics;
    std::optional<Image> cover;

    bool operator==(const TagData&) const = default;
};

}  // namespace maestro::backend
