#include "scanner/LibraryScanner.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include <exception>
#include <iterator>
#include <vector>

namespace music2json::scanner {

LibraryScanner::LibraryScanner(const AlbumAggregator& aggregator)
    : aggregator_(aggregator) {}

void LibraryScanner::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

const model::ScanResult& LibraryScanner::scan_directory(const std::filesystem::path& root, int artist_limit) {
    result_ = model::ScanResult{};
    util::Logger::info("LibraryScanner: Scanning directory: " + root.string());

    std::vector<std::string> artist_dirs;
    try {
        for (const auto& entry : util::DirectoryScanner::list_directory(root)) {
            if (entry.is_directory()) {
                artist_dirs.push_back(entry.name);
            }
        }
    } catch (const std::exception& e) {
        util::Logger::error("LibraryScanner: Cannot list library root: " + std::string(e.what()));
        result_.errors.push_back({root.string(), e.what()});
        return result_;
    }

    if (artist_limit > 0 && artist_dirs.size() > static_cast<size_t>(artist_limit)) {
        artist_dirs.resize(static_cast<size_t>(artist_limit));
        util::Logger::info("LibraryScanner: Limiting scan to " + std::to_string(artist_limit) + " artists");
    }

    const int total = static_cast<int>(artist_dirs.size());
    int done = 0;

    // Artists are processed one at a time; concurrency lives in the album batches
    for (const auto& artist_name : artist_dirs) {
        if (progress_callback_) {
            progress_callback_(done, total, artist_name);
        }
        scan_artist(root / artist_name, artist_name);
        ++done;
    }

    util::Logger::info("LibraryScanner: Scan complete: " + std::to_string(result_.artists.size()) +
                       " artists, " + std::to_string(result_.errors.size()) + " errors");
    return result_;
}

void LibraryScanner::scan_artist(const std::filesystem::path& artist_path, const std::string& artist_name) {
    util::Logger::info("LibraryScanner: Processing artist: " + artist_name);

    std::vector<util::DirectoryScanner::Entry> entries;
    try {
        entries = util::DirectoryScanner::list_directory(artist_path);
    } catch (const std::exception& e) {
        util::Logger::warn("LibraryScanner: Cannot list artist directory: " + std::string(e.what()));
        result_.errors.push_back({artist_path.string(), e.what()});
        return;
    }

    model::Artist artist;
    artist.name = artist_name;

    for (const auto& entry : entries) {
        if (!entry.is_directory()) continue;

        auto album_result = aggregator_.process_album(artist_path / entry.name, entry.name);
        if (album_result.album) {
            artist.albums.push_back(std::move(*album_result.album));
        }
        result_.errors.insert(result_.errors.end(),
                              std::make_move_iterator(album_result.errors.begin()),
                              std::make_move_iterator(album_result.errors.end()));
    }

    if (!artist.albums.empty()) {
        result_.artists.push_back(std::move(artist));
    } else {
        util::Logger::debug("LibraryScanner: Skipping artist without albums: " + artist_name);
    }
}

}  // namespace music2json::scanner
