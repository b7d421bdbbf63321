#pragma once

#include <string>

namespace cadence::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Truncates the log file. Level defaults to Info, CADENCE_LOG=debug lowers it.
    static void init();
    static void set_level(Level level);
    static Level level();

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace cadence::util
