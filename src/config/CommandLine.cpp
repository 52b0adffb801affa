#include "config/CommandLine.hpp"
#include <boost/program_options.hpp>
#include <sstream>

namespace music2json::config {

CommandLine CommandLine::parse(int argc, const char* const argv[], const Config& defaults) {
    namespace program_options = boost::program_options;

    CommandLine cmd;
    cmd.config = defaults;

    program_options::options_description options{ "Options" };
    // clang-format off
    options.add_options()
        ("music-dir,m", program_options::value<std::string>()->default_value(defaults.music_directory.string(), defaults.music_directory.empty() ? "$MUSIC_PATH" : defaults.music_directory.string()), "Path to your music directory")
        ("output,o", program_options::value<std::string>()->default_value(defaults.output_path.string()), "Output directory or file path")
        ("limit,l", program_options::value<int>()->default_value(defaults.artist_limit), "Limit the number of artists to process (0 = no limit)")
        ("version,v", "Show version number")
        ("help,h", "Show help");
    // clang-format on

    std::ostringstream usage;
    usage << options;
    cmd.usage = usage.str();

    program_options::variables_map vm;
    try {
        program_options::store(program_options::parse_command_line(argc, argv, options), vm);
        program_options::notify(vm);
    } catch (const program_options::error& e) {
        cmd.action = Action::Invalid;
        cmd.error = e.what();
        return cmd;
    }

    if (vm.count("help")) {
        cmd.action = Action::ShowHelp;
        return cmd;
    }
    if (vm.count("version")) {
        cmd.action = Action::ShowVersion;
        return cmd;
    }

    cmd.config.music_directory = vm["music-dir"].as<std::string>();
    cmd.config.output_path = vm["output"].as<std::string>();
    cmd.config.artist_limit = vm["limit"].as<int>();

    if (cmd.config.music_directory.empty()) {
        cmd.action = Action::Invalid;
        cmd.error = "Music directory not specified. Please provide it via .env file or --music-dir argument";
    }

    return cmd;
}

}  // namespace music2json::config
