#pragma once

#include "model/Library.hpp"
#include "probe/MetadataProbe.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <vector>

namespace music2json::scanner {

struct AlbumResult {
    std::optional<model::Album> album;  // Absent when no track was produced
    std::vector<model::ProcessingError> errors;
};

// Builds one Album from the audio files of a single directory.
// Files are probed in fixed-size batches; all probes of a batch run
// concurrently and the next batch starts only when the current one is done.
class AlbumAggregator {
public:
    static constexpr size_t DEFAULT_BATCH_SIZE = 10;

    // Called on the aggregating thread before a batch is started
    using BatchCallback = std::function<void(size_t batch_index, size_t batch_size)>;

    explicit AlbumAggregator(const probe::MetadataProbe& probe, size_t batch_size = DEFAULT_BATCH_SIZE);

    void set_batch_callback(BatchCallback callback);

    // Never throws; listing failures come back as a single error for album_path
    AlbumResult process_album(const std::filesystem::path& album_path, const std::string& album_name) const;

    size_t batch_size() const { return batch_size_; }

private:
    const probe::MetadataProbe& probe_;
    size_t batch_size_;
    BatchCallback batch_callback_;

    std::vector<std::filesystem::path> list_audio_files(const std::filesystem::path& album_path) const;

    // Fault-isolated probe: every exception becomes a failed ProbeResult
    probe::ProbeResult probe_file(const std::filesystem::path& file) const;
};

}  // namespace music2json::scanner
