#pragma once

#include "model/Library.hpp"
#include <cstddef>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

namespace music2json::report {

constexpr const char* DEFAULT_OUTPUT_NAME = "music_metadata.json";
constexpr const char* ERROR_FILE_NAME = "music_metadata_errors.json";
constexpr size_t ERROR_SAMPLE_SIZE = 5;

class ReportWriter {
public:
    explicit ReportWriter(std::filesystem::path output_file);

    // Directory (existing, or missing without extension) -> <dir>/music_metadata.json,
    // anything else is taken as the target file
    static std::filesystem::path resolve_output_file(const std::filesystem::path& output);

    // Pretty-printed artist array with genre arrays on one line
    static std::string serialize_artists(const std::vector<model::Artist>& artists);
    static std::string serialize_errors(const std::vector<model::ProcessingError>& errors);

    // Collapses every "genres": [...] array of a pretty-printed document onto one line
    static std::string compact_genre_arrays(const std::string& json);

    const std::filesystem::path& output_file() const { return output_file_; }
    std::filesystem::path error_file() const;

    // Creates the output directory if needed
    bool prepare() const;

    // Writes the report (only with artists) and the error file (only with errors).
    // Progress lines and the error sample go to out. Returns false if a file could
    // not be written.
    bool write(const model::ScanResult& result, std::ostream& out) const;

private:
    std::filesystem::path output_file_;

    static bool write_file(const std::filesystem::path& path, const std::string& content);
};

}  // namespace music2json::report
