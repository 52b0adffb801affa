#pragma once

#include <string>
#include <vector>

namespace music2json::model {

struct Track {
    std::string title;

    bool operator==(const Track&) const = default;
};

struct Album {
    std::string title;
    std::vector<std::string> genres;  // Unique, first-insertion order
    std::vector<Track> tracks;

    bool operator==(const Album&) const = default;
};

struct Artist {
    std::string name;
    std::vector<Album> albums;

    bool operator==(const Artist&) const = default;
};

// One entry per failed file or failed directory listing
struct ProcessingError {
    std::string file;
    std::string error;

    bool operator==(const ProcessingError&) const = default;
};

struct ScanResult {
    std::vector<Artist> artists;
    std::vector<ProcessingError> errors;
};

}  // namespace music2json::model
