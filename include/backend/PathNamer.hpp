#pragma once

#include "model/Text.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace maestro::backend {

inline constexpr std::string_view FRONT_COVER = "Front Cover";
inline constexpr std::string_view MP3_EXTENSION = ".mp3";

// Decimal digit count; num_digits(0) == 1.
int num_digits(size_t n);

// Zero-padded decimal of the given width.
std::string zero_pad(size_t n, int width);

// "Disc N" padded to the width of num_discs, or nullopt for a single-disc album.
std::optional<std::string> disc_folder_name(size_t disc_number, size_t num_discs);

// "NN - Title.mp3", or just "Title.mp3" when the album has one track on one disc.
std::string track_filename(size_t track_number, size_t num_tracks, size_t num_discs,
                           const model::Text& title);

// Flat car-safe name "D-TT - Title.mp3" (disc and track padded independently).
// Single-disc albums use track_filename().
std::string track_filename_vw(size_t disc_number, size_t num_discs,
                              size_t track_number, size_t num_tracks,
                              const model::Text& title);

}  // namespace maestro::backend
