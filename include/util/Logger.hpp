#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace music2json::util {

class Logger {
public:
    enum class Level { Debug, Info, Warn, Error };

    // Opens the log file (truncating it). Warn and Error are echoed to stderr
    // when echo_to_stderr is set.
    static void init(const std::filesystem::path& log_path, Level min_level = Level::Info,
                     bool echo_to_stderr = true);

    // Reads MUSIC2JSON_LOG and MUSIC2JSON_LOG_LEVEL, then calls init()
    static void init_from_environment();

    static std::optional<Level> parse_level(const std::string& name);

    static void log(Level level, const std::string& message);
    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warn(const std::string& message);
    static void error(const std::string& message);
};

}  // namespace music2json::util
