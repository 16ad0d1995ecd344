#include "command.hpp"
#include "observed_set.hpp"
#include "store_pair.hpp"

#include <stdexcept>

const char* usage() {
  return "usage: revstamp <update|status|hash|version> "
         "[--hash-file <path>] [--version-file <path>] [-q|-v] [file...]";
}

CommandOptions parse_command_line(int argc, char** argv) {
  if (argc < 2) {
    throw std::invalid_argument("missing command");
  }

  CommandOptions opts;
  opts.command = argv[1];

  const auto defaults = StorePair::from_build_config();
  opts.hash_file = defaults.hash_file();
  opts.version_file = defaults.version_file();

  // skip program name and command
  for (int i = 2; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--hash-file" || arg == "--version-file") {
      if (i + 1 >= argc) {
        throw std::invalid_argument(arg + " needs a path");
      }
      (arg == "--hash-file" ? opts.hash_file : opts.version_file) = argv[++i];
    }
    else if (arg == "-q" || arg == "--quiet") opts.verbosity = Verbosity::Quiet;
    else if (arg == "-v" || arg == "--verbose") opts.verbosity = Verbosity::Verbose;
    else if (arg.size() > 1 && arg[0] == '-') {
      throw std::invalid_argument("unknown option: " + arg);
    }
    else opts.observed.emplace_back(std::move(arg));
  }

  if (opts.observed.empty()) {
    opts.observed = ObservedSet::from_build_config().paths();
  }
  return opts;
}
