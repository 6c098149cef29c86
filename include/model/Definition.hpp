#pragma once

#include "model/Text.hpp"
#include <optional>
#include <string>
#include <vector>

namespace maestro::model {

// Raw album definition as read from extras/album.yaml.
// Numbers are positional: a track's number is its index in the disc + 1.

struct Track {
    Text title;
    std::optional<std::vector<Text>> artists;
    std::optional<int> year;
    std::optional<Text> genre;
    std::optional<Text> comment;
    std::optional<Text> lyrics;
    std::optional<std::string> filename;  // relative to the album root

    bool operator==(const Track&) const = default;
};

struct Disc {
    std::vector<Track> tracks;

    bool operator==(const Disc&) const = default;
};

struct Album {
    Text title;
    std::vector<Text> artists;
    std::optional<int> year;
    std::optional<Text> genre;
    std::vector<Disc> discs;

    bool operator==(const Album&) const = default;
};

}  // namespace maestro::model
