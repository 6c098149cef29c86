#pragma once

#include <filesystem>
#include <string>

namespace maestro::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Opens (truncates) the log file. Messages below min_level are dropped.
    static void init(const std::filesystem::path& path, Level min_level = Level::Warn);
    static void set_level(Level min_level);
    static Level level();

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);

    // "debug", "info", "warn", "error"; anything else yields fallback
    static Level parse_level(const std::string& name, Level fallback);
};

}  // namespace maestro::util
