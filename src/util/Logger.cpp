#include "util/Logger.hpp"
#include <atomic>
#include <ctime>
#include <fmt/format.h>
#include <fstream>
#include <iomanip>
#include <mutex>

namespace halo::util {

namespace {
    std::mutex log_mutex;
    std::ofstream log_file;  // Kept open between writes
    std::string log_path = "/tmp/halo_debug.log";
    std::atomic<Logger::Level> min_level{Logger::Level::Debug};

    const char* level_tag(Logger::Level level) {
        switch (level) {
            case Logger::Level::Debug: return "[DEBUG] ";
            case Logger::Level::Info:  return "[INFO]  ";
            case Logger::Level::Warn:  return "[WARN]  ";
            case Logger::Level::Error: return "[ERROR] ";
        }
        return "";
    }
}

void Logger::init(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_path = path;
    log_file.open(log_path, std::ios::trunc);
}

void Logger::set_level(Level level) {
    min_level.store(level);
}

Logger::Level Logger::level() {
    return min_level.load();
}

Logger::Level Logger::parse_level(const std::string& name) {
    if (name == "debug") return Level::Debug;
    if (name == "warn") return Level::Warn;
    if (name == "error") return Level::Error;
    return Level::Info;
}

void Logger::log(Level level, const std::string& message) {
    if (level < min_level.load()) return;

    std::lock_guard<std::mutex> lock(log_mutex);
    if (!log_file.is_open()) {
        // Not initialized: append to the default file
        log_file.open(log_path, std::ios::app);
    }
    if (!log_file) return;

    auto now = std::time(nullptr);
    std::tm tm{};
    localtime_r(&now, &tm);

    log_file << std::put_time(&tm, "[%H:%M:%S] ");
    log_file << fmt::format("{}{}\n", level_tag(level), message);
    log_file.flush();
}

void Logger::debug(const std::string& message) { log(Level::Debug, message); }
void Logger::info(const std::string& message) { log(Level::Info, message); }
void Logger::warn(const std::string& message) { log(Level::Warn, message); }
void Logger::error(const std::string& message) { log(Level::Error, message); }

}  // namespace halo::util
