#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Grammar of a version line:
//
//   version-line = *WSP "Version:" 1*SP digits *WSP
//
// WSP covers space, tab and a trailing '\r'. A digit run that overflows
// 64 bits does not match.
std::optional<std::uint64_t> parse_version_line(std::string_view line);

// First line of `text` that matches the grammar, if any.
std::optional<std::uint64_t> find_version(std::string_view text);

// Always exactly "Version: N", no newline.
std::string format_version_line(std::uint64_t version);

// version + 1, throws ArithmeticError when that is not representable.
std::uint64_t next_version(std::uint64_t version);
