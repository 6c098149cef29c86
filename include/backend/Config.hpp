#pragma once

#include "backend/CoverResolver.hpp"
#include <string>
#include <filesystem>

namespace maestro::backend {

struct Config {
    // Cover settings
    int cover_size = 1000;
    int cover_size_vw = 300;
    int jpeg_quality = 75;

    // Export settings
    std::filesystem::path export_root;      // empty: an output folder must be given
    std::string export_format = "full";     // "full" or "vw"

    // Log settings
    std::filesystem::path log_file;
    std::string log_level = "warn";

    CoverSettings cover_settings() const {
        return CoverSettings{cover_size, cover_size_vw, jpeg_quality};
    }
};

class ConfigLoader {
public:
    // Loads ~/.config/maestro/config.toml, or defaults if it doesn't exist
    static Config load_config();
    static Config load_from_file(const std::filesystem::path& path);
    static bool save_config(const Config& cfg, const std::filesystem::path& path);

    static std::filesystem::path get_config_file();

private:
    static Config create_default_config();
};

}  // namespace maestro::backend
