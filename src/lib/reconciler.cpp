#include "reconciler.hpp"
#include "version_line.hpp"

#include <spdlog/spdlog.h>

const char* to_string(ReconcileState state) {
    switch (state) {
    case ReconcileState::Bootstrapped: return "bootstrapped";
    case ReconcileState::Unchanged:    return "unchanged";
    case ReconcileState::Advanced:     return "advanced";
    }
    return "unknown";
}

ReconcileResult Reconciler::run() const {
    ReconcileResult r;

    r.bootstrap = stores_.bootstrap();
    if (r.bootstrap.created_hash_store) {
        spdlog::info("created hash store {}", stores_.hash_file().string());
    }
    if (r.bootstrap.created_version_store) {
        spdlog::info("created version store {}", stores_.version_file().string());
    }

    r.old_fingerprint = stores_.read_fingerprint();
    if (!r.old_fingerprint.empty() && !Fingerprint::from_hex(r.old_fingerprint)) {
        spdlog::warn("hash store {} holds a malformed fingerprint",
                     stores_.hash_file().string());
    }

    r.new_fingerprint = observed_.fingerprint().to_hex();
    spdlog::debug("stored fingerprint '{}', current '{}'",
                  r.old_fingerprint, r.new_fingerprint);

    if (r.old_fingerprint == r.new_fingerprint) {
        r.state = ReconcileState::Unchanged;
        return r;
    }

    // Both of these may throw; nothing has been written yet.
    const std::uint64_t old_version = stores_.read_version();
    const std::uint64_t new_version = next_version(old_version);

    stores_.write_fingerprint(r.new_fingerprint);
    stores_.write_version(new_version);

    r.state = ReconcileState::Advanced;
    r.old_version = old_version;
    r.new_version = new_version;
    return r;
}

StatusReport Reconciler::inspect() const {
    StatusReport s;
    s.stored_fingerprint = stores_.peek_fingerprint();
    s.stored_version = stores_.peek_version();
    s.current_fingerprint = observed_.fingerprint().to_hex();
    s.would_advance = s.stored_fingerprint.value_or("") != s.current_fingerprint;
    return s;
}
