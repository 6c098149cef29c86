#include "backend/Config.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <fstream>
#include <stdexcept>
#include <string>

namespace maestro::backend {

namespace {

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r");
    return s.substr(start, end - start + 1);
}

// Parses an integer in [min, max]; anything else keeps the current value
void parse_int(const std::string& key, const std::string& value, int min, int max, int& out) {
    try {
        size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size() || parsed < min || parsed > max) {
            throw std::out_of_range(value);
        }
        out = parsed;
    } catch (const std::exception&) {
        maestro::util::Logger::warn("Config: Ignoring invalid value for " + key + ": '" + value + "'");
    }
}

}  // namespace

Config ConfigLoader::load_config() {
    maestro::util::Logger::info("Config: Loading configuration");

    auto config_file = get_config_file();
    std::error_code ec;
    if (std::filesystem::exists(config_file, ec)) {
        return load_from_file(config_file);
    }
    maestro::util::Logger::debug("Config: No config file at " + config_file.string() + ", using defaults");
    return create_default_config();
}

Config ConfigLoader::load_from_file(const std::filesystem::path& path) {
    maestro::util::Logger::debug("Config: Loading from " + path.string());

    Config cfg = create_default_config();

    std::ifstream file(path);
    if (!file) {
        maestro::util::Logger::warn("Config: Couldn't open " + path.string() + ", using defaults");
        return cfg;
    }

    std::string line, current_section;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        // Section header
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Key = value
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            maestro::util::Logger::warn("Config: Ignoring malformed line: " + line);
            continue;
        }
        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove quotes from strings
        if (value.length() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.length() - 2);
        }

        if (current_section == "covers") {
            if (key == "size") parse_int("covers.size", value, 1, 10000, cfg.cover_size);
            else if (key == "size_vw") parse_int("covers.size_vw", value, 1, 10000, cfg.cover_size_vw);
            else if (key == "jpeg_quality") parse_int("covers.jpeg_quality", value, 1, 100, cfg.jpeg_quality);
        }
        else if (current_section == "export") {
            if (key == "root") cfg.export_root = std::filesystem::path(value);
            else if (key == "format") {
                if (value == "full" || value == "vw") {
                    cfg.export_format = value;
                } else {
                    maestro::util::Logger::warn("Config: Unknown export format '" + value + "'");
                }
            }
        }
        else if (current_section == "log") {
            if (key == "file") cfg.log_file = std::filesystem::path(value);
            else if (key == "level") cfg.log_level = value;
        }
    }

    return cfg;
}

bool ConfigLoader::save_config(const Config& cfg, const std::filesystem::path& path) {
    maestro::util::Logger::info("Config: Saving configuration to " + path.string());

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream file(path);
    if (!file) {
        maestro::util::Logger::error("Config: Couldn't write " + path.string());
        return false;
    }

    file << "# maestro config\n\n";

    file << "[covers]\n";
    file << "# Standard covers are scaled to fit size x size\n";
    file << "size = " << cfg.cover_size << "\n";
    file << "# Car-safe covers are scaled to fit size_vw x size_vw\n";
    file << "size_vw = " << cfg.cover_size_vw << "\n";
    file << "# JPEG quality (1-100)\n";
    file << "jpeg_quality = " << cfg.jpeg_quality << "\n\n";

    file << "[export]\n";
    file << "# Albums export to <root>/<artist>/<title> when no output folder is given\n";
    if (!cfg.export_root.empty()) {
        file << "root = \"" << cfg.export_root.string() << "\"\n";
    } else {
        file << "# root = \"~/Export\"\n";
    }
    file << "# Export format: \"full\", \"vw\"\n";
    file << "format = \"" << cfg.export_format << "\"\n\n";

    file << "[log]\n";
    file << "file = \"" << cfg.log_file.string() << "\"\n";
    file << "# Level: \"debug\", \"info\", \"warn\", \"error\"\n";
    file << "level = \"" << cfg.log_level << "\"\n";

    file.close();
    return static_cast<bool>(file);
}

std::filesystem::path ConfigLoader::get_config_file() {
    return maestro::util::Platform::get_config_directory() / "config.toml";
}

Config ConfigLoader::create_default_config() {
    Config cfg;
    cfg.log_file = maestro::util::Platform::get_cache_directory() / "maestro.log";
    return cfg;
}

}  // namespace maestro::backend
