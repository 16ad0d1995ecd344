#pragma once

#include "observed_set.hpp"
#include "store_pair.hpp"

#include <cstdint>
#include <optional>
#include <string>

enum class ReconcileState { Bootstrapped, Unchanged, Advanced };

const char* to_string(ReconcileState state);

struct ReconcileResult {
    ReconcileState state = ReconcileState::Bootstrapped;
    BootstrapResult bootstrap;
    std::string old_fingerprint;
    std::string new_fingerprint;
    // Only read when the state is Advanced.
    std::optional<std::uint64_t> old_version;
    std::optional<std::uint64_t> new_version;
};

// Read-only view of what the next run() would do.
struct StatusReport {
    std::optional<std::string> stored_fingerprint; // nullopt: no hash store
    std::string current_fingerprint;
    std::optional<std::uint64_t> stored_version;   // nullopt: missing or unparseable
    bool would_advance = false;
};

class Reconciler {
public:
    Reconciler(StorePair stores, ObservedSet observed)
        : stores_(std::move(stores)), observed_(std::move(observed)) {}

    // Bootstraps the stores, then advances the version iff the observed
    // content no longer matches the stored fingerprint. The version is read
    // and incremented before anything is written, so a ParseError or
    // ArithmeticError leaves both stores untouched.
    ReconcileResult run() const;

    // Never creates or writes a store.
    StatusReport inspect() const;

private:
    StorePair stores_;
    ObservedSet observed_;
};
