#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <format>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace music2json::util {

static std::mutex log_mutex;
static std::ofstream log_file;  // Keep file open for performance
static std::filesystem::path log_file_path = "/tmp/music2json.log";
static Logger::Level min_log_level = Logger::Level::Info;
static bool echo_stderr = true;

void Logger::init(const std::filesystem::path& log_path, Level min_level, bool echo_to_stderr) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_file.is_open()) {
        log_file.close();
    }
    log_file_path = log_path;
    min_log_level = min_level;
    echo_stderr = echo_to_stderr;
    log_file.open(log_file_path, std::ios::trunc);
}

void Logger::init_from_environment() {
    std::filesystem::path path = "/tmp/music2json.log";
    if (const char* env_path = std::getenv("MUSIC2JSON_LOG"); env_path && *env_path) {
        path = env_path;
    }

    Level level = Level::Info;
    if (const char* env_level = std::getenv("MUSIC2JSON_LOG_LEVEL"); env_level && *env_level) {
        level = parse_level(env_level).value_or(Level::Info);
    }

    init(path, level);
}

std::optional<Logger::Level> Logger::parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error") return Level::Error;
    return std::nullopt;
}

void Logger::log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < min_log_level) return;

    if (echo_stderr && level >= Level::Warn) {
        std::cerr << (level == Level::Warn ? "Warning: " : "Error: ") << message << std::endl;
    }

    if (!log_file.is_open()) {
        // Fallback: open if not initialized
        log_file.open(log_file_path, std::ios::app);
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

}  // namespace music2json::util
