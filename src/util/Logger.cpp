#include "util/Logger.hpp"
#include <fstream>
#include <iomanip>
#include <ctime>
#include <mutex>
#include <format>

namespace hue::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Keep file open for performance

static constexpr const char* kFallbackLogPath = "/tmp/hue_debug.log";

void Logger::init(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    if (path.has_parent_path() && !std::filesystem::exists(path.parent_path())) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }
    log_file.open(path, std::ios::trunc);
    if (!log_file) {
        // Unwritable location, keep logging somewhere
        log_file.clear();
        log_file.open(kFallbackLogPath, std::ios::app);
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_file.is_open()) {
        log_file.open(kFallbackLogPath, std::ios::app);
    }
    if (!log_file) return;

    auto now = std::time(nullptr);
    auto tm = *std::localtime(&now);

    std::string_view level_str;
    switch (level) {
        case Level::Debug: level_str = "[DEBUG] "; break;
        case Level::Info:  level_str = "[INFO]  "; break;
        case Level::Warn:  level_str = "[WARN]  "; break;
        case Level::Error: level_str = "[ERROR] "; break;
    }

    log_file << std::put_time(&tm, "[%H:%M:%S] ");
    log_file << std::format("{}{}\n", level_str, message);
    log_file.flush();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

}  // namespace hue::util
