#pragma once

#include "probe/MetadataProbe.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace music2json::test {

// Scratch directory removed on destruction
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("music2json_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::filesystem::path mkdir(const std::string& relative) const {
        auto dir = path_ / relative;
        std::filesystem::create_directories(dir);
        return dir;
    }

    std::filesystem::path touch(const std::string& relative, const std::string& content = "dummy content") const {
        auto file = path_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream f(file);
        f << content;
        return file;
    }

private:
    std::filesystem::path path_;
};

// Probe with scripted results keyed by file name.
// Unknown files succeed without title or genres.
class FakeProbe : public probe::MetadataProbe {
public:
    std::map<std::string, probe::ProbeResult> results;
    std::vector<std::string> throwing;  // File names whose probe throws
    std::chrono::milliseconds delay{0};

    probe::ProbeResult probe(const std::string& path) const override {
        int now = in_flight_.fetch_add(1) + 1;
        int peak = peak_.load();
        while (now > peak && !peak_.compare_exchange_weak(peak, now)) {}

        std::string name = std::filesystem::path(path).filename().string();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            completed_before_start_[name] = completed_.load();
        }

        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }

        struct Finish {
            const FakeProbe& self;
            ~Finish() {
                self.in_flight_.fetch_sub(1);
                self.completed_.fetch_add(1);
            }
        } finish{*this};

        for (const auto& t : throwing) {
            if (t == name) throw std::runtime_error("probe exploded");
        }

        auto it = results.find(name);
        if (it != results.end()) return it->second;
        return probe::ProbeResult::success(std::nullopt, {});
    }

    int peak_in_flight() const { return peak_.load(); }
    int calls() const { return completed_.load(); }

    // Number of probes that had already finished when the probe of `name` started
    int completed_before(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = completed_before_start_.find(name);
        return it == completed_before_start_.end() ? -1 : it->second;
    }

private:
    mutable std::atomic<int> in_flight_{0};
    mutable std::atomic<int> peak_{0};
    mutable std::atomic<int> completed_{0};
    mutable std::mutex mutex_;
    mutable std::map<std::string, int> completed_before_start_;
};

}  // namespace music2json::test
