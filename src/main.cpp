#include "lib/command.hpp"
#include "lib/commands.hpp"
#include "lib/log.hpp"
#include "lib/store_pair.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>

int main(int argc, char *argv[]) {
  std::cout << std::unitbuf;
  std::cerr << std::unitbuf;

  CommandOptions opts;
  try {
    opts = parse_command_line(argc, argv);
  } catch (const std::invalid_argument &e) {
    init_logging(Verbosity::Normal);
    spdlog::error("{}", e.what());
    std::cerr << usage() << "\n";
    return EXIT_FAILURE;
  }
  init_logging(opts.verbosity);

  auto cmd = make_command(opts.command);
  if (!cmd) {
    spdlog::error("unknown command: {}", opts.command);
    std::cerr << usage() << "\n";
    return EXIT_FAILURE;
  }

  StorePair stores{opts.hash_file, opts.version_file};
  return cmd->execute(opts, stores);
}
