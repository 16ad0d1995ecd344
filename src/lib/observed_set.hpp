#pragma once

#include "fingerprint.hpp"

#include <filesystem>
#include <vector>

namespace fs = std::filesystem;

// The ordered list of files whose combined content drives the version.
// Order is significant: it is the concatenation order for the fingerprint.
class ObservedSet {
public:
    explicit ObservedSet(std::vector<fs::path> paths)
        : paths_(std::move(paths)) {}

    // The list baked in at build time (REVSTAMP_OBSERVED_FILES).
    static ObservedSet from_build_config();

    const std::vector<fs::path>& paths() const { return paths_; }
    bool empty() const { return paths_.empty(); }

    Fingerprint fingerprint() const { return compute_fingerprint(paths_); }

private:
    std::vector<fs::path> paths_;
};
