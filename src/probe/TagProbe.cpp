#include "probe/TagProbe.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <mpg123.h>
#include <sndfile.h>
#include <string_view>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
}

/*
 * TAG PROBING
 *
 * Each container goes through the library that already knows how to open it:
 * - MP3: libmpg123 reads ID3v2 (preferred) and ID3v1 tags after mpg123_scan().
 * - FLAC/OGG: libsndfile exposes Vorbis comments through sf_get_string().
 * - MP4/M4A/AAC: libavformat fills the container metadata dictionary.
 *
 * Only title and genre are read. Audio is never decoded beyond what the
 * libraries need to validate the stream.
 */

namespace music2json::probe {

namespace {
    std::string trim(const std::string& str) {
        if (str.empty()) return "";
        size_t first = str.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) return "";
        size_t last = str.find_last_not_of(" \t\r\n");
        return str.substr(first, (last - first + 1));
    }

    bool all_digits(std::string_view sv) {
        return !sv.empty() && std::all_of(sv.begin(), sv.end(), [](unsigned char c) {
            return std::isdigit(c) != 0;
        });
    }

    // ID3v1 genre list, including the Winamp extensions up to 125
    constexpr std::array<std::string_view, 126> ID3V1_GENRES = {
        "Blues", "Classic Rock", "Country", "Dance", "Disco", "Funk", "Grunge",
        "Hip-Hop", "Jazz", "Metal", "New Age", "Oldies", "Other", "Pop", "R&B",
        "Rap", "Reggae", "Rock", "Techno", "Industrial", "Alternative", "Ska",
        "Death Metal", "Pranks", "Soundtrack", "Euro-Techno", "Ambient",
        "Trip-Hop", "Vocal", "Jazz+Funk", "Fusion", "Trance", "Classical",
        "Instrumental", "Acid", "House", "Game", "Sound Clip", "Gospel", "Noise",
        "AlternRock", "Bass", "Soul", "Punk", "Space", "Meditative",
        "Instrumental Pop", "Instrumental Rock", "Ethnic", "Gothic", "Darkwave",
        "Techno-Industrial", "Electronic", "Pop-Folk", "Eurodance", "Dream",
        "Southern Rock", "Comedy", "Cult", "Gangsta", "Top 40", "Christian Rap",
        "Pop/Funk", "Jungle", "Native American", "Cabaret", "New Wave",
        "Psychadelic", "Rave", "Showtunes", "Trailer", "Lo-Fi", "Tribal",
        "Acid Punk", "Acid Jazz", "Polka", "Retro", "Musical", "Rock & Roll",
        "Hard Rock", "Folk", "Folk-Rock", "National Folk", "Swing",
        "Fast Fusion", "Bebob", "Latin", "Revival", "Celtic", "Bluegrass",
        "Avantgarde", "Gothic Rock", "Progressive Rock", "Psychedelic Rock",
        "Symphonic Rock", "Slow Rock", "Big Band", "Chorus", "Easy Listening",
        "Acoustic", "Humour", "Speech", "Chanson", "Opera", "Chamber Music",
        "Sonata", "Symphony", "Booty Bass", "Primus", "Porn Groove", "Satire",
        "Slow Jam", "Club", "Tango", "Samba", "Folklore", "Ballad",
        "Power Ballad", "Rhythmic Soul", "Freestyle", "Duet", "Punk Rock",
        "Drum Solo", "A capella", "Euro-House", "Dance Hall"
    };

    std::string genre_by_index(const std::string& digits) {
        if (digits.size() > 3) return digits;
        size_t index = static_cast<size_t>(std::stoul(digits));
        if (index < ID3V1_GENRES.size()) return std::string(ID3V1_GENRES[index]);
        return digits;
    }

    void add_unique(std::vector<std::string>& genres, const std::string& genre) {
        if (genre.empty()) return;
        if (std::find(genres.begin(), genres.end(), genre) == genres.end()) {
            genres.push_back(genre);
        }
    }

    std::string av_error_string(int code) {
        char errbuf[256];
        av_strerror(code, errbuf, sizeof(errbuf));
        return errbuf;
    }

    const char* av_tag(AVDictionary* dict, const char* key) {
        const AVDictionaryEntry* entry = av_dict_get(dict, key, nullptr, 0);
        return entry ? entry->value : nullptr;
    }
}

// Helper class to ensure mpg123 is initialized
struct Mpg123Initializer {
    Mpg123Initializer() { mpg123_init(); }
    ~Mpg123Initializer() { mpg123_exit(); }
};
static Mpg123Initializer g_mpg123_init;

ProbeResult TagProbe::probe(const std::string& path) const {
    if (!std::filesystem::exists(path)) {
        return ProbeResult::failure("File not found");
    }

    switch (detect_container(path)) {
        case Container::MP3:      return probe_mp3(path);
        case Container::Sndfile:  return probe_sndfile(path);
        case Container::AvFormat: return probe_avformat(path);
        case Container::Unknown:  break;
    }
    return ProbeResult::failure("Unsupported file type");
}

std::string TagProbe::resolve_genre(const std::string& value) {
    std::string genre = trim(value);
    if (genre.empty()) return genre;

    if (genre == "RX") return "Remix";
    if (genre == "CR") return "Cover";

    if (all_digits(genre)) return genre_by_index(genre);

    // ID3v2.3 style "(17)" or "(17)Refinement"
    if (genre.front() == '(') {
        size_t close = genre.find(')');
        if (close != std::string::npos) {
            std::string ref = genre.substr(1, close - 1);
            std::string refinement = trim(genre.substr(close + 1));
            if (!refinement.empty()) return refinement;
            if (all_digits(ref)) return genre_by_index(ref);
            if (ref == "RX") return "Remix";
            if (ref == "CR") return "Cover";
        }
    }
    return genre;
}

std::vector<std::string> TagProbe::split_genres(const std::string& value, char separator) {
    std::vector<std::string> genres;
    size_t start = 0;
    while (start <= value.size()) {
        size_t end = value.find(separator, start);
        if (end == std::string::npos) end = value.size();
        add_unique(genres, resolve_genre(value.substr(start, end - start)));
        start = end + 1;
    }
    return genres;
}

TagProbe::Container TagProbe::detect_container(const std::string& path) {
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (ext == ".mp3") return Container::MP3;
    if (ext == ".flac" || ext == ".ogg") return Container::Sndfile;
    if (ext == ".m4a" || ext == ".mp4" || ext == ".aac") return Container::AvFormat;

    return Container::Unknown;
}

ProbeResult TagProbe::probe_mp3(const std::string& path) {
    int err = MPG123_OK;
    mpg123_handle* mh = mpg123_new(nullptr, &err);
    if (!mh) return ProbeResult::failure(mpg123_plain_strerror(err));

    if (mpg123_open(mh, path.c_str()) != MPG123_OK) {
        std::string message = mpg123_strerror(mh);
        mpg123_delete(mh);
        return ProbeResult::failure(message);
    }

    // Scan parses the whole stream, including ID3 tags and frame headers
    if (mpg123_scan(mh) != MPG123_OK) {
        util::Logger::debug("TagProbe: Scan incomplete for " + path + ": " + mpg123_strerror(mh));
    }

    long rate;
    int channels, encoding;
    if (mpg123_getformat(mh, &rate, &channels, &encoding) != MPG123_OK) {
        std::string message = "Invalid MPEG audio stream: " + std::string(mpg123_strerror(mh));
        mpg123_close(mh);
        mpg123_delete(mh);
        return ProbeResult::failure(message);
    }

    std::optional<std::string> title;
    std::vector<std::string> genres;

    mpg123_id3v1* v1 = nullptr;
    mpg123_id3v2* v2 = nullptr;
    if (mpg123_id3(mh, &v1, &v2) == MPG123_OK) {
        if (v2) {
            if (v2->title && v2->title->p) {
                std::string t = trim(v2->title->p);
                if (!t.empty()) title = t;
            }
            // ID3v2.4 multi-value frames keep their NUL separators
            if (v2->genre && v2->genre->p && v2->genre->fill > 0) {
                genres = split_genres(std::string(v2->genre->p, v2->genre->fill - 1), '\0');
            }
        }
        if (v1) {
            if (!title) {
                std::string t = trim(std::string(v1->title, strnlen(v1->title, sizeof(v1->title))));
                if (!t.empty()) title = t;
            }
            // 255 marks "no genre"
            if (genres.empty() && v1->genre != 255) {
                add_unique(genres, resolve_genre(std::to_string(v1->genre)));
            }
        }
    }

    if (mpg123_close(mh) != MPG123_OK) {
        util::Logger::warn("TagProbe: Failed to close MP3 handle for " + path + ": " + mpg123_strerror(mh));
    }
    mpg123_delete(mh);

    return ProbeResult::success(std::move(title), std::move(genres));
}

ProbeResult TagProbe::probe_sndfile(const std::string& path) {
    util::Logger::debug("TagProbe: Parsing file with libsndfile: " + path);

    SF_INFO sfinfo;
    std::memset(&sfinfo, 0, sizeof(sfinfo));

    SNDFILE* sndfile = nullptr;
    {
        // sf_strerror(nullptr) reads libsndfile's process-wide error of the last
        // failed sf_open; the lock keeps that error paired with this open
        static std::mutex sf_open_mutex;
        std::lock_guard<std::mutex> lock(sf_open_mutex);
        sndfile = sf_open(path.c_str(), SFM_READ, &sfinfo);
        if (!sndfile) {
            return ProbeResult::failure(sf_strerror(nullptr));
        }
    }

    auto get_tag = [&](int tag_id) -> std::string {
        const char* val = sf_get_string(sndfile, tag_id);
        return val ? trim(val) : "";
    };

    std::optional<std::string> title;
    std::string t = get_tag(SF_STR_TITLE);
    if (!t.empty()) title = t;

    std::vector<std::string> genres = split_genres(get_tag(SF_STR_GENRE), ';');

    int rc = sf_close(sndfile);
    if (rc != 0) {
        util::Logger::warn("TagProbe: Failed to close " + path + ": " + sf_error_number(rc));
    }

    return ProbeResult::success(std::move(title), std::move(genres));
}

ProbeResult TagProbe::probe_avformat(const std::string& path) {
    util::Logger::debug("TagProbe: Parsing file with libavformat: " + path);

    AVFormatContext* format_ctx = nullptr;
    int ret = avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
        return ProbeResult::failure(av_error_string(ret));
    }

    ret = avformat_find_stream_info(format_ctx, nullptr);
    if (ret < 0) {
        std::string message = "Failed to find stream info: " + av_error_string(ret);
        avformat_close_input(&format_ctx);
        return ProbeResult::failure(message);
    }

    AVDictionary* metadata = format_ctx->metadata;

    // Some muxers keep tags on the audio stream instead of the container
    int stream_index = av_find_best_stream(format_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
    if (stream_index < 0) {
        avformat_close_input(&format_ctx);
        return ProbeResult::failure("No audio stream found");
    }
    AVDictionary* stream_metadata = format_ctx->streams[stream_index]->metadata;

    const char* title_tag = av_tag(metadata, "title");
    if (!title_tag) title_tag = av_tag(stream_metadata, "title");
    const char* genre_tag = av_tag(metadata, "genre");
    if (!genre_tag) genre_tag = av_tag(stream_metadata, "genre");

    std::optional<std::string> title;
    if (title_tag) {
        std::string t = trim(title_tag);
        if (!t.empty()) title = t;
    }

    std::vector<std::string> genres;
    if (genre_tag) genres = split_genres(genre_tag, ';');

    avformat_close_input(&format_ctx);

    return ProbeResult::success(std::move(title), std::move(genres));
}

}  // namespace music2json::probe
