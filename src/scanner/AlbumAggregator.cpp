#include "scanner/AlbumAggregator.hpp"
#include "util/DirectoryScanner.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <exception>
#include <system_error>
#include <thread>

namespace music2json::scanner {

AlbumAggregator::AlbumAggregator(const probe::MetadataProbe& probe, size_t batch_size)
    : probe_(probe), batch_size_(std::max<size_t>(batch_size, 1)) {}

void AlbumAggregator::set_batch_callback(BatchCallback callback) {
    batch_callback_ = std::move(callback);
}

std::vector<std::filesystem::path> AlbumAggregator::list_audio_files(const std::filesystem::path& album_path) const {
    std::vector<std::filesystem::path> files;
    for (const auto& entry : util::DirectoryScanner::list_directory(album_path)) {
        if (entry.is_file() && util::DirectoryScanner::is_audio_extension(entry.name)) {
            files.push_back(album_path / entry.name);
        }
    }
    return files;
}

probe::ProbeResult AlbumAggregator::probe_file(const std::filesystem::path& file) const {
    try {
        return probe_.probe(file.string());
    } catch (const std::exception& e) {
        return probe::ProbeResult::failure(e.what());
    } catch (...) {
        return probe::ProbeResult::failure("Unknown error while reading metadata");
    }
}

AlbumResult AlbumAggregator::process_album(const std::filesystem::path& album_path,
                                           const std::string& album_name) const {
    AlbumResult result;

    try {
        const auto files = list_audio_files(album_path);
        if (files.empty()) {
            util::Logger::debug("AlbumAggregator: No audio files in " + album_path.string());
            return result;
        }

        model::Album album;
        album.title = album_name;

        size_t batch_index = 0;
        for (size_t begin = 0; begin < files.size(); begin += batch_size_, ++batch_index) {
            const size_t end = std::min(begin + batch_size_, files.size());
            const size_t count = end - begin;

            if (batch_callback_) {
                batch_callback_(batch_index, count);
            }
            util::Logger::debug("AlbumAggregator: Batch " + std::to_string(batch_index) + " of " +
                                album_path.string() + " (" + std::to_string(count) + " files)");

            // Each worker writes only its own slot
            std::vector<probe::ProbeResult> results(count);
            std::vector<std::jthread> workers;
            workers.reserve(count);

            for (size_t i = 0; i < count; ++i) {
                const auto& file = files[begin + i];
                try {
                    workers.emplace_back([this, &file, &slot = results[i]]() {
                        slot = probe_file(file);
                    });
                } catch (const std::system_error& e) {
                    // Thread creation failed: probe on this thread instead
                    util::Logger::warn("AlbumAggregator: Cannot start worker (" + std::string(e.what()) +
                                       "), probing inline: " + file.string());
                    results[i] = probe_file(file);
                }
            }

            // Wait for the whole batch before merging (jthread also joins on unwind)
            for (auto& worker : workers) {
                worker.join();
            }

            // Merge in listing order
            for (size_t i = 0; i < count; ++i) {
                const auto& file = files[begin + i];
                auto& probed = results[i];

                if (!probed.ok) {
                    util::Logger::debug("AlbumAggregator: Probe failed for " + file.string() + ": " + probed.error);
                    result.errors.push_back({file.string(), probed.error});
                    continue;
                }

                for (auto& genre : probed.genres) {
                    if (std::find(album.genres.begin(), album.genres.end(), genre) == album.genres.end()) {
                        album.genres.push_back(std::move(genre));
                    }
                }

                std::string title = probed.title.value_or("");
                if (title.empty()) {
                    title = file.filename().string();
                }
                album.tracks.push_back({std::move(title)});
            }
        }

        if (!album.tracks.empty()) {
            result.album = std::move(album);
        } else {
            util::Logger::info("AlbumAggregator: No readable tracks in " + album_path.string());
        }
    } catch (const std::exception& e) {
        util::Logger::warn("AlbumAggregator: Failed to process " + album_path.string() + ": " + e.what());
        result.album.reset();
        result.errors.push_back({album_path.string(), e.what()});
    }

    return result;
}

}  // namespace music2json::scanner
