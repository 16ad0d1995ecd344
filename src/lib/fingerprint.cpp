#include "fingerprint.hpp"
#include "errors.hpp"

#include <fstream>
#include <iterator>
#include <openssl/sha.h>
#include <system_error>

static constexpr std::string_view kDigits = "0123456789abcdef";

static int nibble(char c) {
    if (c >= 'A' && c <= 'F') c = static_cast<char>(c - 'A' + 'a');
    const auto pos = kDigits.find(c);
    return pos == std::string_view::npos ? -1 : static_cast<int>(pos);
}

std::string Fingerprint::to_hex() const {
    std::string out;
    out.reserve(digest.size() * 2);
    for (unsigned char b : digest) {
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0x0f]);
    }
    return out;
}

std::optional<Fingerprint> Fingerprint::from_hex(std::string_view hex) {
    Fingerprint fp;
    if (hex.size() != fp.digest.size() * 2) {
        return std::nullopt;
    }

    for (std::size_t i = 0; i < fp.digest.size(); ++i) {
        const int hi = nibble(hex[2 * i]);
        const int lo = nibble(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        fp.digest[i] = static_cast<unsigned char>(hi * 16 + lo);
    }
    return fp;
}

Fingerprint Fingerprint::of_bytes(std::string_view bytes) {
    Fingerprint fp;
    SHA1(reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size(),
         fp.digest.data());
    return fp;
}

std::string read_file_bytes(const fs::path& p) {
    std::ifstream f(p, std::ios::binary);
    if (!f) {
        throw IOError("could not open file: " + p.string());
    }
    std::string bytes((std::istreambuf_iterator<char>(f)),
                      std::istreambuf_iterator<char>());
    if (f.bad()) {
        throw IOError("could not read file: " + p.string());
    }
    return bytes;
}

Fingerprint compute_fingerprint(const std::vector<fs::path>& paths) {
    if (paths.empty()) {
        throw IOError("no files to observe");
    }

    std::string stream;
    for (const auto& p : paths) {
        // a missing file is reported by read_file_bytes below
        std::error_code ec;
        const auto st = fs::status(p, ec);
        if (ec && st.type() != fs::file_type::not_found) {
            throw IOError("cannot stat " + p.string() + ": " + ec.message());
        }
        // a directory opens fine on Linux but reads nothing
        if (fs::is_directory(st)) {
            throw IOError("not a regular file: " + p.string());
        }
        stream.append(read_file_bytes(p));
    }

    return Fingerprint::of_bytes(stream);
}
