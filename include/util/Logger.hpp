#pragma once

#include <string>

namespace halo::util {

/**
 * Process-wide file logger. Lines below the current level are dropped.
 * Safe to call from any thread.
 */
class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    static void init(const std::string& path = "/tmp/halo_debug.log");
    static void set_level(Level level);
    static Level level();

    // Parse "debug" / "info" / "warn" / "error"; unknown names give Info
    static Level parse_level(const std::string& name);

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace halo::util
