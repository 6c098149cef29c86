#pragma once

#include "model/Definition.hpp"
#include <filesystem>

namespace maestro::backend {

// Builds a starting album definition from the tags of the MP3s under a folder.
// Album-level values are the most common across tracks; tracks are grouped
// into discs by their disc number (untagged tracks go to disc 1).
class AlbumGenerator {
public:
    static model::Album generate(const std::filesystem::path& root);
};

}  // namespace maestro::backend
