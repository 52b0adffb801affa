#include "config/CommandLine.hpp"
#include "config/Config.hpp"
#include "probe/TagProbe.hpp"
#include "report/ReportWriter.hpp"
#include "scanner/AlbumAggregator.hpp"
#include "scanner/LibraryScanner.hpp"
#include "util/Logger.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <unistd.h>

#ifndef MUSIC2JSON_VERSION
#define MUSIC2JSON_VERSION "1.0.0"
#endif

namespace {

bool is_readable_directory(const std::filesystem::path& dir) {
    std::error_code ec;
    return std::filesystem::is_directory(dir, ec) && access(dir.c_str(), R_OK | X_OK) == 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace music2json;

    try {
        util::Logger::init_from_environment();
        util::Logger::info("music2json " MUSIC2JSON_VERSION " starting...");

        // Environment first, then .env (never overriding), then the command line
        config::ConfigLoader::load_env_file(config::ConfigLoader::default_env_file());
        auto cmd = config::CommandLine::parse(argc, argv, config::ConfigLoader::from_environment());

        switch (cmd.action) {
            case config::CommandLine::Action::ShowHelp:
                std::cout << "Usage: " << argv[0] << " [options]\n\n" << cmd.usage << std::endl;
                return EXIT_SUCCESS;
            case config::CommandLine::Action::ShowVersion:
                std::cout << MUSIC2JSON_VERSION << std::endl;
                return EXIT_SUCCESS;
            case config::CommandLine::Action::Invalid:
                util::Logger::error(cmd.error);
                std::cerr << "\n" << cmd.usage << std::endl;
                return EXIT_FAILURE;
            case config::CommandLine::Action::Run:
                break;
        }

        const auto& cfg = cmd.config;
        if (!is_readable_directory(cfg.music_directory)) {
            util::Logger::error("Music directory \"" + cfg.music_directory.string() +
                                "\" does not exist or is not accessible");
            return EXIT_FAILURE;
        }

        report::ReportWriter writer(report::ReportWriter::resolve_output_file(cfg.output_path));

        std::cout << "Starting scan of music directory: " << cfg.music_directory.string() << std::endl;
        std::cout << "Will save results to: " << writer.output_file().string() << std::endl;

        if (!writer.prepare()) {
            return EXIT_FAILURE;
        }

        probe::TagProbe probe;
        scanner::AlbumAggregator aggregator(probe, cfg.batch_size);
        scanner::LibraryScanner library_scanner(aggregator);
        library_scanner.set_progress_callback([](int done, int total, const std::string& artist) {
            std::cout << "Processing artist (" << (done + 1) << "/" << total << "): " << artist << std::endl;
        });

        // Whatever was gathered is saved even if the scan is cut short
        try {
            library_scanner.scan_directory(cfg.music_directory, cfg.artist_limit);
        } catch (const std::exception& e) {
            util::Logger::error("Scan aborted: " + std::string(e.what()) + " (saving partial results)");
        }

        const auto& result = library_scanner.result();
        if (!writer.write(result, std::cout)) {
            return EXIT_FAILURE;
        }

        util::Logger::info("music2json finished: " + std::to_string(result.artists.size()) + " artists, " +
                           std::to_string(result.errors.size()) + " errors");
        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        util::Logger::error("Fatal error: " + std::string(e.what()));
        return EXIT_FAILURE;
    }
}
