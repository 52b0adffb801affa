#pragma once

#include "model/Library.hpp"
#include "scanner/AlbumAggregator.hpp"
#include <filesystem>
#include <functional>
#include <string>

namespace music2json::scanner {

// Walks <root>/<artist>/<album>/ sequentially and builds the ScanResult.
//
// Results accumulate inside the scanner, so result() still holds everything
// gathered so far if scan_directory() is interrupted by an exception.
class LibraryScanner {
public:
    using ProgressCallback = std::function<void(int artists_done, int artists_total, const std::string& artist)>;

    explicit LibraryScanner(const AlbumAggregator& aggregator);

    // Called before each artist is processed
    void set_progress_callback(ProgressCallback callback);

    // artist_limit <= 0 means unlimited
    const model::ScanResult& scan_directory(const std::filesystem::path& root, int artist_limit = 0);

    const model::ScanResult& result() const { return result_; }

private:
    const AlbumAggregator& aggregator_;
    ProgressCallback progress_callback_;
    model::ScanResult result_;

    void scan_artist(const std::filesystem::path& artist_path, const std::string& artist_name);
};

}  // namespace music2json::scanner
