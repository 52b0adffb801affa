#pragma once

#include "probe/MetadataProbe.hpp"
#include <string>
#include <vector>

namespace music2json::probe {

// Production probe backed by the native decoder libraries:
// libmpg123 for MP3, libsndfile for FLAC/OGG, libavformat for MP4/M4A/AAC.
class TagProbe : public MetadataProbe {
public:
    ProbeResult probe(const std::string& path) const override;

    // Map an ID3 genre reference ("17", "(17)", "(17)Refinement", "RX", "CR")
    // to its name. Anything else is returned trimmed and unchanged.
    static std::string resolve_genre(const std::string& value);

    // Split a tag value holding several genres (NUL or ';' separated),
    // trim, resolve and drop empties and duplicates.
    static std::vector<std::string> split_genres(const std::string& value, char separator);

private:
    enum class Container { MP3, Sndfile, AvFormat, Unknown };

    static Container detect_container(const std::string& path);

    static ProbeResult probe_mp3(const std::string& path);
    static ProbeResult probe_sndfile(const std::string& path);
    static ProbeResult probe_avformat(const std::string& path);
};

}  // namespace music2json::probe
