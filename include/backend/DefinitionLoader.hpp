#pragma once

#include "model/Definition.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>

namespace maestro::backend {

// Malformed or incomplete album definition. The message names the offending
// field, e.g. "discs[1][0].title: missing \"text\" key".
class DefinitionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Reads and writes album.yaml.
 *
 *   title: Album                  # text: "x" or {text: "x", ascii: "y"}
 *   artist: Someone               # or artists: [A, B]
 *   year: 2020
 *   genre: Rock
 *   tracks:                       # or discs: [[...], [...]]
 *     - Plain Title
 *     - title: Other
 *       artists: [A, B]
 *       filename: misc/other.mp3
 */
class DefinitionLoader {
public:
    static model::Album parse(const std::string& yaml);
    static model::Album load_file(const std::filesystem::path& path);

    static std::string emit(const model::Album& album);
    static void save_file(const model::Album& album, const std::filesystem::path& path);
};

}  // namespace maestro::backend
