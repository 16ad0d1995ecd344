#pragma once

#include <array>
#include <filesystem>
#include <openssl/sha.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// SHA-1 digest of the observed content. Stored and compared as its
// 40-character lowercase hex rendering.
struct Fingerprint {
    std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};

    bool operator==(const Fingerprint&) const noexcept = default;

    std::string to_hex() const;

    // nullopt unless `hex` is exactly 40 hex digits (either case)
    static std::optional<Fingerprint> from_hex(std::string_view hex);

    // SHA-1 over an in-memory byte stream
    static Fingerprint of_bytes(std::string_view bytes);
};

// Reads the whole file in binary mode. Throws IOError if it can't be opened
// or read.
std::string read_file_bytes(const fs::path& p);

// Concatenates the contents of `paths` in order, with nothing in between,
// and hashes the result. Any unreadable file aborts the whole computation.
Fingerprint compute_fingerprint(const std::vector<fs::path>& paths);
