#pragma once

#include "log.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// Everything a command needs, after defaults and command-line overrides
// have been merged.
struct CommandOptions {
    std::string command;
    fs::path hash_file;
    fs::path version_file;
    std::vector<fs::path> observed;
    Verbosity verbosity = Verbosity::Normal;
};

// argv[1] is the command name. Throws std::invalid_argument on bad usage.
CommandOptions parse_command_line(int argc, char** argv);

const char* usage();
