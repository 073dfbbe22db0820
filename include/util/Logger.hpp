#pragma once

#include <filesystem>
#include <string>

namespace hue::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Opens (and truncates) the log file. Messages logged before init()
    // land in /tmp/hue_debug.log.
    static void init(const std::filesystem::path& log_file);
    static void shutdown();

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace hue::util
