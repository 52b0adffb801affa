#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace music2json::probe {

struct ProbeResult {
    bool ok = false;
    std::optional<std::string> title;
    std::vector<std::string> genres;
    std::string error;  // Set when !ok

    static ProbeResult success(std::optional<std::string> title, std::vector<std::string> genres) {
        ProbeResult result;
        result.ok = true;
        result.title = std::move(title);
        result.genres = std::move(genres);
        return result;
    }

    static ProbeResult failure(std::string error) {
        ProbeResult result;
        result.error = std::move(error);
        return result;
    }
};

// Reads embedded tags from one audio file.
// Implementations report every failure through ProbeResult and must be
// callable from several threads at once.
class MetadataProbe {
public:
    virtual ~MetadataProbe() = default;

    virtual ProbeResult probe(const std::string& path) const = 0;
};

}  // namespace music2json::probe
