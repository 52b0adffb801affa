#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

namespace music2json::config {

struct Config {
    // Library settings
    std::filesystem::path music_directory;
    int artist_limit = 0;  // <= 0: unlimited
    size_t batch_size = 10;

    // Output settings
    std::filesystem::path output_path = ".";
};

class ConfigLoader {
public:
    // Loads KEY=VALUE pairs from a dotenv file into the process environment.
    // Existing variables are never overridden. Returns the number of variables set;
    // a missing file is not an error.
    static int load_env_file(const std::filesystem::path& path);

    // MUSIC_PATH and OUTPUT_PATH
    static Config from_environment();

    static std::filesystem::path default_env_file();
};

}  // namespace music2json::config
