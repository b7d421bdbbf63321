#include "util/Logger.hpp"
#include <atomic>
#include <cstdlib>
#include <ctime>
#include <format>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <string_view>

namespace cadence::util {

namespace {
    constexpr const char* LOG_PATH = "/tmp/cadence_debug.log";

    std::mutex log_mutex;
    std::ofstream log_file;
    std::atomic<Logger::Level> min_level{Logger::Level::Info};
}

void Logger::init() {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_file.open(LOG_PATH, std::ios::trunc);

    const char* env = std::getenv("CADENCE_LOG");
    if (env && std::string_view(env) == "debug") {
        min_level = Level::Debug;
    }
}

void Logger::set_level(Level level) {
    min_level = level;
}

Logger::Level Logger::level() {
    return min_level.load();
}

void Logger::log(Level level, const std::string& message) {
    if (level < min_level.load()) return;

    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_file.is_open()) {
        // Tests and tools log without calling init()
        log_file.open(LOG_PATH, std::ios::app);
    }
    if (!log_file) return;

    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

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

}  // namespace cadence::util
