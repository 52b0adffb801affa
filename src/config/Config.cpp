#include "config/Config.hpp"
#include "util/Logger.hpp"
#include <cstdlib>
#include <fstream>
#include <string>

namespace music2json::config {

namespace {
    std::string trim(const std::string& str) {
        auto start = str.find_first_not_of(" \t\r");
        if (start == std::string::npos) return "";
        auto end = str.find_last_not_of(" \t\r");
        return str.substr(start, end - start + 1);
    }
}

int ConfigLoader::load_env_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        util::Logger::debug("Config: No env file at " + path.string());
        return 0;
    }

    util::Logger::info("Config: Loading " + path.string());

    int loaded = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') continue;

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        // Key = value
        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) continue;

        // Remove quotes from strings; unquoted values may carry a trailing comment
        if (value.length() >= 2 && (value.front() == '"' || value.front() == '\'') &&
            value.back() == value.front()) {
            value = value.substr(1, value.length() - 2);
        } else {
            auto hash_pos = value.find(" #");
            if (hash_pos != std::string::npos) {
                value = trim(value.substr(0, hash_pos));
            }
        }

        if (std::getenv(key.c_str())) {
            util::Logger::debug("Config: Keeping existing environment value for " + key);
            continue;
        }

        if (setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++loaded;
        } else {
            util::Logger::warn("Config: Cannot set environment variable " + key);
        }
    }

    util::Logger::info("Config: Loaded " + std::to_string(loaded) + " variables from " + path.string());
    return loaded;
}

Config ConfigLoader::from_environment() {
    Config cfg;

    if (const char* music = std::getenv("MUSIC_PATH"); music && *music) {
        cfg.music_directory = music;
    }
    if (const char* output = std::getenv("OUTPUT_PATH"); output && *output) {
        cfg.output_path = output;
    }
    return cfg;
}

std::filesystem::path ConfigLoader::default_env_file() {
    return std::filesystem::current_path() / ".env";
}

}  // namespace music2json::config
