#include "../framework/SimpleTest.hpp"
#include "../framework/Fixtures.hpp"
#include "scanner/AlbumAggregator.hpp"
#include "util/Logger.hpp"
#include <cstdio>
#include <string>
#include <vector>

using namespace music2json;
using music2json::probe::ProbeResult;
using music2json::test::FakeProbe;
using music2json::test::TempDir;

namespace {
    std::string numbered(const char* prefix, int i, const char* ext) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%s%02d%s", prefix, i, ext);
        return buf;
    }
}

TEST_CASE(test_album_builds_tracks_in_listing_order) {
    TempDir tmp;
    auto album_dir = tmp.mkdir("Album");
    tmp.touch("Album/b.mp3");
    tmp.touch("Album/a.flac");
    tmp.touch("Album/c.ogg");

    FakeProbe probe;
    probe.results["a.flac"] = ProbeResult::success("First", {"Rock"});
    probe.results["b.mp3"] = ProbeResult::success("Second", {"Rock"});
    probe.results["c.ogg"] = ProbeResult::success("Third", {});

    scanner::AlbumAggregator aggregator(probe);
    auto result = aggregator.process_album(album_dir, "Album");

    ASSERT_TRUE(result.album.has_value());
    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.album->title, "Album");
    ASSERT_EQ(result.album->tracks.size(), 3u);
    ASSERT_EQ(result.album->tracks[0].title, "First");
    ASSERT_EQ(result.album->tracks[1].title, "Second");
    ASSERT_EQ(result.album->tracks[2].title, "Third");
    ASSERT_EQ(result.album->genres, std::vector<std::string>{"Rock"});
}

TEST_CASE(test_album_genres_are_deduplicated_union) {
    TempDir tmp;
    auto album_dir = tmp.mkdir("Album");
    tmp.touch("Album/1.mp3");
    tmp.touch("Album/2.mp3");

    FakeProbe probe;
    probe.results["1.mp3"] = ProbeResult::success("One", {"Rock", "Jazz"});
    probe.results["2.mp3"] = ProbeResult::success("Two", {"Jazz", "Blues"});

    scanner::AlbumAggregator aggregator(probe);
    auto result = aggregator.process_album(album_dir, "Album");

    ASSERT_TRUE(result.album.has_value());
    std::vector<std::string> expected = {"Rock", "Jazz", "Blues"};
    ASSERT_EQ(result.album->genres, expected);
}

TEST_CASE(test_album_partial_failure_keeps_successful_tracks) {
    TempDir tmp;
    auto album_dir = tmp.mkdir("Album");
    for (int i = 0; i < 6; ++i) {
        tmp.touch("Album/" + numbered("t", i, ".mp3"));
    }

    FakeProbe probe;
    probe.results["t01.mp3"] = ProbeResult::failure("corrupt header");
    probe.results["t04.mp3"] = ProbeResult::failure("unexpected end of file");

    scanner::AlbumAggregator aggregator(probe);
    auto result = aggregator.process_album(album_dir, "Album");

    ASSERT_TRUE(result.album.has_value());
    ASSERT_EQ(result.album->tracks.size(), 4u);
    ASSERT_EQ(result.errors.size(), 2u);
    ASSERT_EQ(result.errors[0].file, (album_dir / "t01.mp3").string());
    ASSERT_EQ(result.errors[0].error, "corrupt header");
    ASSERT_EQ(result.errors[1].file, (album_dir / "t04.mp3").string());
    ASSERT_EQ(result.errors[1].error, "unexpected end of file");
}

TEST_CASE(test_album_all_failures_yield_no_album) {
    TempDir tmp;
    auto album_dir = tmp.mkdir("Album");
    tmp.touch("Album/x.mp3");
    tmp.touch("Album/y.m4a");

    FakeProbe probe;
    probe.results["x.mp3"] = ProbeResult::failure("bad");
    probe.results["y.m4a"] = ProbeResult::failure("bad");

    scanner::AlbumAggregator aggregator(probe);
    auto result = aggregator.process_album(album_dir, "Album");

    ASSERT_FALSE(result.album.has_value());
    ASSERT_EQ(result.errors.size(), 2u);
}

TEST_CASE(test_album_without_audio_files_is_silently_skipped) {
    TempDir tmp;
    auto album_dir = tmp.mkdir("Album");
    tmp.touch("Album/cover.jpg");
    tmp.touch("Album/notes.txt");
    tmp.mkdir("Album/Disc 1.mp3");  // Directory, not a file

    FakeProbe probe;
    scanner::AlbumAggregator aggregator(probe);
    auto result = aggregator.process_album(album_dir, "Album");

    ASSERT_FALSE(result.album.has_value());
    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(probe.calls(), 0);
}

TEST_CASE(test_album_extension_filter_is_case_insensitive) {
    TempDir tmp;
    auto album_dir = tmp.mkdir("Album");
    tmp.touch("Album/LOUD.MP3");
    tmp.touch("Album/mixed.FlAc");
    tmp.touch("Album/video.Mp4");
    tmp.touch("Album/raw.aac");
    tmp.touch("Album/skip.wav");

    FakeProbe probe;
    scanner::AlbumAggregator aggregator(probe);
    auto result = aggregator.process_album(album_dir, "Album");

    ASSERT_TRUE(result.album.has_value());
    ASSERT_EQ(result.album->tracks.size(), 4u);
    ASSERT_EQ(probe.calls(), 4);
}

TEST_CASE(test_album_missing_title_falls_back_to_file_name) {
    TempDir tmp;
    auto album_dir = tmp.mkdir("Album");
    tmp.touch("Album/01 Intro.mp3");
    tmp.touch("Album/02 Outro.ogg");

    FakeProbe probe;
    probe.results["02 Outro.ogg"] = ProbeResult::success(std::string(), {"Ambient"});

    scanner::AlbumAggregator aggregator(probe);
    auto result = aggregator.process_album(album_dir, "Album");

    ASSERT_TRUE(result.album.has_value());
    ASSERT_EQ(result.album->tracks[0].title, "01 Intro.mp3");
    ASSERT_EQ(result.album->tracks[1].title, "02 Outro.ogg");
}

TEST_CASE(test_album_throwing_probe_is_isolated) {
    TempDir tmp;
    auto album_dir = tmp.mkdir("Album");
    tmp.touch("Album/boom.mp3");
    tmp.touch("Album/fine.mp3");

    FakeProbe probe;
    probe.throwing.push_back("boom.mp3");
    probe.results["fine.mp3"] = ProbeResult::success("Fine", {});

    scanner::AlbumAggregator aggregator(probe);
    auto result = aggregator.process_album(album_dir, "Album");

    ASSERT_TRUE(result.album.has_value());
    ASSERT_EQ(result.album->tracks.size(), 1u);
    ASSERT_EQ(result.album->tracks[0].title, "Fine");
    ASSERT_EQ(result.errors.size(), 1u);
    ASSERT_EQ(result.errors[0].file, (album_dir / "boom.mp3").string());
    ASSERT_EQ(result.errors[0].error, "probe exploded");
}

TEST_CASE(test_album_listing_failure_is_single_error) {
    TempDir tmp;
    auto missing = tmp.path() / "does-not-exist";

    FakeProbe probe;
    scanner::AlbumAggregator aggregator(probe);
    auto result = aggregator.process_album(missing, "does-not-exist");

    ASSERT_FALSE(result.album.has_value());
    ASSERT_EQ(result.errors.size(), 1u);
    ASSERT_EQ(result.errors[0].file, missing.string());
    ASSERT_FALSE(result.errors[0].error.empty());
}

TEST_CASE(test_album_batches_of_ten_ten_five) {
    TempDir tmp;
    auto album_dir = tmp.mkdir("Album");
    for (int i = 0; i < 25; ++i) {
        tmp.touch("Album/" + numbered("track", i, ".mp3"));
    }

    FakeProbe probe;
    probe.delay = std::chrono::milliseconds(5);
    probe.results["track00.mp3"] = ProbeResult::failure("broken");

    std::vector<size_t> batch_sizes;
    scanner::AlbumAggregator aggregator(probe);
    aggregator.set_batch_callback([&](size_t, size_t size) { batch_sizes.push_back(size); });

    auto result = aggregator.process_album(album_dir, "Album");

    std::vector<size_t> expected = {10, 10, 5};
    ASSERT_EQ(batch_sizes, expected);
    ASSERT_EQ(probe.calls(), 25);
    ASSERT_TRUE(probe.peak_in_flight() <= 10);

    // A batch only starts once every probe of the previous batch has finished
    for (int i = 0; i < 25; ++i) {
        ASSERT_TRUE(probe.completed_before(numbered("track", i, ".mp3")) >= (i / 10) * 10);
    }

    ASSERT_TRUE(result.album.has_value());
    ASSERT_EQ(result.album->tracks.size(), 24u);
    ASSERT_EQ(result.errors.size(), 1u);
    ASSERT_EQ(result.album->tracks[0].title, "track01.mp3");
}

TEST_CASE(test_album_custom_batch_size) {
    TempDir tmp;
    auto album_dir = tmp.mkdir("Album");
    for (int i = 0; i < 7; ++i) {
        tmp.touch("Album/" + numbered("s", i, ".ogg"));
    }

    FakeProbe probe;
    std::vector<size_t> batch_sizes;
    scanner::AlbumAggregator aggregator(probe, 3);
    aggregator.set_batch_callback([&](size_t, size_t size) { batch_sizes.push_back(size); });

    auto result = aggregator.process_album(album_dir, "Album");

    std::vector<size_t> expected = {3, 3, 1};
    ASSERT_EQ(batch_sizes, expected);
    ASSERT_EQ(result.album->tracks.size(), 7u);
}

int main() {
    TempDir log_dir;
    util::Logger::init(log_dir.path() / "aggregator.log", util::Logger::Level::Debug, false);
    return music2json::test::TestRunner::instance().run_all();
}
