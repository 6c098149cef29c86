#include "util/Platform.hpp"
#include "util/Logger.hpp"
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <string>

namespace maestro::util {

std::filesystem::path Platform::get_config_directory() {
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".config" / "maestro";
    }
    maestro::util::Logger::warn("Platform: HOME env var not set, using fallback: .config/maestro");
    return ".config/maestro";
}

std::filesystem::path Platform::get_cache_directory() {
    auto home = std::getenv("HOME");
    if (home) {
        return std::filesystem::path(home) / ".cache" / "maestro";
    }
    return "/tmp";
}

bool Platform::is_mp3_file(const std::filesystem::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext == ".mp3";
}

}  // namespace maestro::util
