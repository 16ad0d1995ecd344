// commands.cpp
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

#include <spdlog/spdlog.h>

#include "commands.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "reconciler.hpp"

// -------------------- Small helpers (local to this TU) --------------------

// The single reporting path for every fatal condition.
static int fail(const char* command, const std::exception& e) {
  const char* kind = "error";
  if (dynamic_cast<const IOError*>(&e)) kind = "I/O error";
  else if (dynamic_cast<const ParseError*>(&e)) kind = "parse error";
  else if (dynamic_cast<const ArithmeticError*>(&e)) kind = "arithmetic error";
  spdlog::error("{}: {}: {}", command, kind, e.what());
  return EXIT_FAILURE;
}

// ------------------------------ update -----------------------------------

struct UpdateCommand : ICommand {
  const char* name() const override { return "update"; }
  int execute(const CommandOptions& opts, const StorePair& stores) override {
    try {
      Reconciler reconciler{stores, ObservedSet{opts.observed}};
      const ReconcileResult r = reconciler.run();

      if (r.state == ReconcileState::Unchanged) {
        spdlog::info("sources unchanged, keeping current version");
        return EXIT_SUCCESS;
      }

      done_logger()->info("version {} -> {} ({})", *r.old_version,
                          *r.new_version, stores.version_file().string());
      return EXIT_SUCCESS;
    } catch (const std::exception& e) {
      return fail(name(), e);
    }
  }
};

// ------------------------------ status -----------------------------------

struct StatusCommand : ICommand {
  const char* name() const override { return "status"; }
  int execute(const CommandOptions& opts, const StorePair& stores) override {
    try {
      Reconciler reconciler{stores, ObservedSet{opts.observed}};
      const StatusReport s = reconciler.inspect();

      if (!s.stored_fingerprint) {
        spdlog::warn("hash store {} does not exist yet", stores.hash_file().string());
      }
      if (!s.stored_version) {
        spdlog::warn("no version found in {}", stores.version_file().string());
      }

      std::cout << "stored:  " << s.stored_fingerprint.value_or("(none)") << "\n"
                << "current: " << s.current_fingerprint << "\n"
                << "version: "
                << (s.stored_version ? std::to_string(*s.stored_version) : "(none)")
                << "\n"
                << "state:   " << (s.would_advance ? "changed" : "unchanged") << "\n";
      return EXIT_SUCCESS;
    } catch (const std::exception& e) {
      return fail(name(), e);
    }
  }
};

// ------------------------------- hash ------------------------------------

struct HashCommand : ICommand {
  const char* name() const override { return "hash"; }
  int execute(const CommandOptions& opts, const StorePair& /*stores*/) override {
    try {
      std::cout << ObservedSet{opts.observed}.fingerprint().to_hex() << "\n";
      return EXIT_SUCCESS;
    } catch (const std::exception& e) {
      return fail(name(), e);
    }
  }
};

// ------------------------------ version ----------------------------------

struct VersionCommand : ICommand {
  const char* name() const override { return "version"; }
  int execute(const CommandOptions& /*opts*/, const StorePair& stores) override {
    try {
      std::cout << stores.read_version() << "\n";
      return EXIT_SUCCESS;
    } catch (const std::exception& e) {
      return fail(name(), e);
    }
  }
};

// ------------------------------- Factory ---------------------------------

std::unique_ptr<ICommand> make_command(const std::string& name) {
  if (name == "update")  return std::make_unique<UpdateCommand>();
  if (name == "status")  return std::make_unique<StatusCommand>();
  if (name == "hash")    return std::make_unique<HashCommand>();
  if (name == "version") return std::make_unique<VersionCommand>();
  return nullptr;
}
