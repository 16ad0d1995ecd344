#include "store_pair.hpp"
#include "errors.hpp"
#include "fingerprint.hpp"
#include "version_line.hpp"

#include <fstream>
#include <system_error>

#ifndef REVSTAMP_HASH_FILE
#define REVSTAMP_HASH_FILE "version.sha1"
#endif
#ifndef REVSTAMP_VERSION_FILE
#define REVSTAMP_VERSION_FILE "version.tex"
#endif

static std::string_view trim(std::string_view s) {
  const char* ws = " \t\r";
  const auto b = s.find_first_not_of(ws);
  if (b == std::string_view::npos) return {};
  const auto e = s.find_last_not_of(ws);
  return s.substr(b, e - b + 1);
}

static std::string first_non_blank_line(std::string_view text) {
  std::size_t begin = 0;
  while (begin < text.size()) {
    std::size_t nl = text.find('\n', begin);
    if (nl == std::string_view::npos) nl = text.size();
    auto line = trim(text.substr(begin, nl - begin));
    if (!line.empty()) return std::string(line);
    begin = nl + 1;
  }
  return {};
}

StorePair::StorePair(fs::path hash_file, fs::path version_file)
    : hash_file_(std::move(hash_file)), version_file_(std::move(version_file)) {}

StorePair StorePair::from_build_config() {
  return StorePair{REVSTAMP_HASH_FILE, REVSTAMP_VERSION_FILE};
}

bool StorePair::create_if_absent(const fs::path& p, std::string_view initial) {
  std::error_code ec;
  if (fs::exists(p, ec)) {
    if (!fs::is_regular_file(p, ec)) {
      throw IOError("store is not a regular file: " + p.string());
    }
    return false;
  }

  {
    std::ofstream out(p, std::ios::binary);
    if (out) {
      out.write(initial.data(), static_cast<std::streamsize>(initial.size()));
    }
  }

  if (!fs::exists(p, ec)) {
    throw IOError("could not create store: " + p.string());
  }
  return true;
}

BootstrapResult StorePair::bootstrap() const {
  BootstrapResult r;
  r.created_hash_store = create_if_absent(hash_file_, "");
  r.created_version_store = create_if_absent(version_file_, format_version_line(0));
  return r;
}

std::string StorePair::read_fingerprint() const {
  return first_non_blank_line(read_file_bytes(hash_file_));
}

std::uint64_t StorePair::read_version() const {
  auto v = find_version(read_file_bytes(version_file_));
  if (!v) {
    throw ParseError("unable to extract current version from " +
                     version_file_.string());
  }
  return *v;
}

std::optional<std::string> StorePair::peek_fingerprint() const {
  std::error_code ec;
  if (!fs::is_regular_file(hash_file_, ec)) return std::nullopt;
  return read_fingerprint();
}

std::optional<std::uint64_t> StorePair::peek_version() const {
  std::error_code ec;
  if (!fs::is_regular_file(version_file_, ec)) return std::nullopt;
  return find_version(read_file_bytes(version_file_));
}

void StorePair::replace_file(const fs::path& p, std::string_view content) {
  auto tmp = p;
  tmp += ".tmp";

  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw IOError("cannot open temp file: " + tmp.string());
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
      std::error_code ignored;
      fs::remove(tmp, ignored);
      throw IOError("error while writing " + tmp.string());
    }
  }

  std::error_code ec;
  fs::rename(tmp, p, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throw IOError("cannot replace " + p.string() + ": " + ec.message());
  }
}

void StorePair::write_fingerprint(std::string_view hex) const {
  replace_file(hash_file_, hex);
}

void StorePair::write_version(std::uint64_t version) const {
  replace_file(version_file_, format_version_line(version));
}
