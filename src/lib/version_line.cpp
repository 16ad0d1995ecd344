#include "version_line.hpp"
#include "errors.hpp"

#include <limits>

static constexpr std::string_view kPrefix = "Version:";

static bool is_wsp(char c) { return c == ' ' || c == '\t' || c == '\r'; }

std::optional<std::uint64_t> parse_version_line(std::string_view line) {
    std::size_t pos = 0;
    while (pos < line.size() && is_wsp(line[pos])) ++pos;

    if (line.substr(pos, kPrefix.size()) != kPrefix) {
        return std::nullopt;
    }
    pos += kPrefix.size();

    // at least one space between the colon and the number
    const std::size_t sp_begin = pos;
    while (pos < line.size() && line[pos] == ' ') ++pos;
    if (pos == sp_begin) {
        return std::nullopt;
    }

    // Parse decimal value
    const std::size_t digits_begin = pos;
    std::uint64_t value = 0;
    constexpr std::uint64_t kMax = std::numeric_limits<std::uint64_t>::max();
    for (; pos < line.size(); ++pos) {
        char c = line[pos];
        if (c < '0' || c > '9') break;
        const auto d = static_cast<std::uint64_t>(c - '0');
        if (value > (kMax - d) / 10) {
            return std::nullopt;
        }
        value = value * 10 + d;
    }
    if (pos == digits_begin) {
        return std::nullopt;
    }

    for (; pos < line.size(); ++pos) {
        if (!is_wsp(line[pos])) return std::nullopt;
    }
    return value;
}

std::optional<std::uint64_t> find_version(std::string_view text) {
    std::size_t begin = 0;
    while (begin <= text.size()) {
        std::size_t nl = text.find('\n', begin);
        if (nl == std::string_view::npos) nl = text.size();
        if (auto v = parse_version_line(text.substr(begin, nl - begin))) {
            return v;
        }
        begin = nl + 1;
    }
    return std::nullopt;
}

std::string format_version_line(std::uint64_t version) {
    return std::string(kPrefix) + " " + std::to_string(version);
}

std::uint64_t next_version(std::uint64_t version) {
    if (version == std::numeric_limits<std::uint64_t>::max()) {
        throw ArithmeticError("cannot increment version " +
                              std::to_string(version));
    }
    return version + 1;
}
