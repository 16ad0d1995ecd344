#pragma once

#include <memory>
#include <spdlog/spdlog.h>

enum class Verbosity { Quiet, Normal, Verbose };

// Installs the stderr loggers: the default "revstamp" logger for failures,
// warnings, info and debug output, and a "done" logger for success
// messages. Safe to call more than once.
void init_logging(Verbosity verbosity);

std::shared_ptr<spdlog::logger> done_logger();
