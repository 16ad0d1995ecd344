#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

struct BootstrapResult {
  bool created_hash_store = false;
  bool created_version_store = false;

  bool created_any() const { return created_hash_store || created_version_store; }
};

// The two files acting as this tool's database: the last committed
// fingerprint and the generated "Version: N" file.
class StorePair {
public:
  StorePair(fs::path hash_file, fs::path version_file);

  // Paths baked in at build time (REVSTAMP_HASH_FILE, REVSTAMP_VERSION_FILE).
  static StorePair from_build_config();

  // Creates a missing hash store as an empty file and a missing version
  // store as "Version: 0". Throws IOError if a file can't be created.
  BootstrapResult bootstrap() const;

  // First non-blank line of the hash store, trimmed; "" if there is none.
  std::string read_fingerprint() const;

  // Throws ParseError if no line matches the version grammar.
  std::uint64_t read_version() const;

  // Non-throwing variants for read-only inspection. A missing file yields
  // nullopt.
  std::optional<std::string> peek_fingerprint() const;
  std::optional<std::uint64_t> peek_version() const;

  // Replace the whole content of the respective store.
  void write_fingerprint(std::string_view hex) const;
  void write_version(std::uint64_t version) const;

  const fs::path& hash_file() const { return hash_file_; }
  const fs::path& version_file() const { return version_file_; }

private:
  static bool create_if_absent(const fs::path& p, std::string_view initial);
  static void replace_file(const fs::path& p, std::string_view content);

  fs::path hash_file_;
  fs::path version_file_;
};
