#pragma once

#include "config/Config.hpp"
#include <string>

namespace music2json::config {

struct CommandLine {
    enum class Action { Run, ShowHelp, ShowVersion, Invalid };

    Action action = Action::Run;
    Config config;
    std::string usage;  // Formatted option descriptions
    std::string error;  // Set when action == Invalid

    // Parses argv on top of defaults (usually ConfigLoader::from_environment()).
    // Never throws; parse failures are reported as Action::Invalid.
    static CommandLine parse(int argc, const char* const argv[], const Config& defaults);
};

}  // namespace music2json::config
