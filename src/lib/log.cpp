#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

static spdlog::level::level_enum level_for(Verbosity v) {
  switch (v) {
  case Verbosity::Quiet:   return spdlog::level::err;
  case Verbosity::Verbose: return spdlog::level::debug;
  case Verbosity::Normal:  break;
  }
  return spdlog::level::info;
}

void init_logging(Verbosity verbosity) {
  spdlog::drop_all();

  auto logger = spdlog::stderr_color_mt("revstamp");
  logger->set_pattern("%^%l%$: %v");

  auto done = spdlog::stderr_color_mt("done");
  done->set_pattern("%^done%$: %v");

  const auto level = level_for(verbosity);
  logger->set_level(level);
  done->set_level(level);

  spdlog::set_default_logger(logger);
}

std::shared_ptr<spdlog::logger> done_logger() {
  if (auto l = spdlog::get("done")) return l;
  // init_logging() not called yet: still keep success messages on stderr
  auto done = spdlog::stderr_color_mt("done");
  done->set_pattern("%^done%$: %v");
  return done;
}
