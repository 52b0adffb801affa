#include "report/ReportWriter.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <nlohmann/json.hpp>
#include <system_error>

namespace music2json::report {

namespace {
    // Keeps artistName/albums, albumTitle/genres/tracks in declaration order
    using json = nlohmann::ordered_json;

    json to_json(const model::Album& album) {
        json tracks = json::array();
        for (const auto& track : album.tracks) {
            tracks.push_back({{"title", track.title}});
        }
        return {
            {"albumTitle", album.title},
            {"genres", album.genres},
            {"tracks", std::move(tracks)},
        };
    }

    json to_json(const model::Artist& artist) {
        json albums = json::array();
        for (const auto& album : artist.albums) {
            albums.push_back(to_json(album));
        }
        return {
            {"artistName", artist.name},
            {"albums", std::move(albums)},
        };
    }

    // Tags are not guaranteed to be valid UTF-8
    std::string dump(const json& j) {
        return j.dump(2, ' ', false, json::error_handler_t::replace);
    }
}

ReportWriter::ReportWriter(std::filesystem::path output_file)
    : output_file_(std::move(output_file)) {}

std::filesystem::path ReportWriter::resolve_output_file(const std::filesystem::path& output) {
    std::error_code ec;
    if (std::filesystem::exists(output, ec)) {
        if (std::filesystem::is_directory(output, ec)) {
            return output / DEFAULT_OUTPUT_NAME;
        }
        return output;
    }

    if (output.has_extension()) {
        return output;
    }
    return output / DEFAULT_OUTPUT_NAME;
}

std::string ReportWriter::serialize_artists(const std::vector<model::Artist>& artists) {
    json doc = json::array();
    for (const auto& artist : artists) {
        doc.push_back(to_json(artist));
    }
    return compact_genre_arrays(dump(doc));
}

std::string ReportWriter::serialize_errors(const std::vector<model::ProcessingError>& errors) {
    json doc = json::array();
    for (const auto& error : errors) {
        doc.push_back({{"file", error.file}, {"error", error.error}});
    }
    return dump(doc);
}

std::string ReportWriter::compact_genre_arrays(const std::string& json_text) {
    static const std::string key = "\"genres\": [";

    std::string out;
    out.reserve(json_text.size());

    size_t pos = 0;
    size_t found;
    while ((found = json_text.find(key, pos)) != std::string::npos) {
        out.append(json_text, pos, found + key.size() - pos);

        size_t i = found + key.size();
        bool in_string = false;
        bool escaped = false;
        for (; i < json_text.size(); ++i) {
            char c = json_text[i];
            if (in_string) {
                out += c;
                if (escaped) escaped = false;
                else if (c == '\\') escaped = true;
                else if (c == '"') in_string = false;
                continue;
            }
            if (c == ']') {
                out += c;
                ++i;
                break;
            }
            if (std::isspace(static_cast<unsigned char>(c))) continue;

            out += c;
            if (c == '"') in_string = true;
            else if (c == ',') out += ' ';
        }
        pos = i;
    }

    out.append(json_text, pos, std::string::npos);
    return out;
}

std::filesystem::path ReportWriter::error_file() const {
    return output_file_.parent_path() / ERROR_FILE_NAME;
}

bool ReportWriter::prepare() const {
    auto dir = output_file_.parent_path();
    if (dir.empty()) return true;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        util::Logger::error("ReportWriter: Cannot create output directory " + dir.string() + ": " + ec.message());
        return false;
    }
    return true;
}

bool ReportWriter::write_file(const std::filesystem::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        util::Logger::error("ReportWriter: Cannot open " + path.string() + " for writing");
        return false;
    }
    file << content;
    file.close();
    if (!file) {
        util::Logger::error("ReportWriter: Failed to write " + path.string());
        return false;
    }
    return true;
}

bool ReportWriter::write(const model::ScanResult& result, std::ostream& out) const {
    bool ok = true;

    if (!result.artists.empty()) {
        out << "\nWriting " << result.artists.size() << " artists to file..." << std::endl;
        if (write_file(output_file_, serialize_artists(result.artists))) {
            out << "Music library JSON saved to " << output_file_.string() << std::endl;
            util::Logger::info("ReportWriter: Wrote " + std::to_string(result.artists.size()) +
                               " artists to " + output_file_.string());
        } else {
            ok = false;
        }
    } else {
        out << "\nNo artists with readable tracks were found; " << output_file_.string()
            << " was not written." << std::endl;
    }

    if (!result.errors.empty()) {
        const auto errors_path = error_file();
        out << "\nEncountered " << result.errors.size() << " errors during processing:" << std::endl;
        if (write_file(errors_path, serialize_errors(result.errors))) {
            out << "Processing errors saved to " << errors_path.string() << std::endl;
        } else {
            ok = false;
        }

        out << "\nSample of errors encountered:" << std::endl;
        const size_t shown = std::min(result.errors.size(), ERROR_SAMPLE_SIZE);
        for (size_t i = 0; i < shown; ++i) {
            out << "  - " << result.errors[i].file << ": " << result.errors[i].error << std::endl;
        }
        if (result.errors.size() > ERROR_SAMPLE_SIZE) {
            out << "  ... and " << (result.errors.size() - ERROR_SAMPLE_SIZE)
                << " more errors (see " << errors_path.string() << " for full list)" << std::endl;
        }
    }

    return ok;
}

}  // namespace music2json::report
