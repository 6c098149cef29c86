#pragma once

#include <filesystem>

namespace maestro::util {

class Platform {
public:
    static std::filesystem::path get_config_directory();
    static std::filesystem::path get_cache_directory();

    static bool is_mp3_file(const std::filesystem::path& path);
};

}  // namespace maestro::util
