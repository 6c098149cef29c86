#include "backend/PathNamer.hpp"
#include <iomanip>
#include <sstream>

namespace maestro::backend {

int num_digits(size_t n) {
    int digits = 1;
    while (n >= 10) {
        n /= 10;
        ++digits;
    }
    return digits;
}

std::string zero_pad(size_t n, int width) {
    std::ostringstream ss;
    ss << std::setw(width) << std::setfill('0') << n;
    return ss.str();
}

std::optional<std::string> disc_folder_name(size_t disc_number, size_t num_discs) {
    if (num_discs == 1) {
        return std::nullopt;
    }
    return "Disc " + zero_pad(disc_number, num_digits(num_discs));
}

std::string track_filename(size_t track_number, size_t num_tracks, size_t num_discs,
                           const model::Text& title) {
    std::string name;
    if (num_tracks != 1 || num_discs != 1) {
        name = zero_pad(track_number, num_digits(num_tracks)) + " - ";
    }
    name += title.file_safe();
    name += MP3_EXTENSION;
    return name;
}

std::string track_filename_vw(size_t disc_number, size_t num_discs,
                              size_t track_number, size_t num_tracks,
                              const model::Text& title) {
    if (num_discs == 1) {
        return track_filename(track_number, num_tracks, num_discs, title);
    }
    std::string name = zero_pad(disc_number, num_digits(num_discs)) + "-" +
                       zero_pad(track_number, num_digits(num_tracks)) + " - ";
    name += title.file_safe();
    name += MP3_EXTENSION;
    return name;
}

}  // namespace maestro::backend
