#pragma once

#include "wiredrive/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace wiredrive::driver {

/// Entries larger than this are refused before any of their data is read.
inline constexpr std::uint64_t kMaxEntrySize = 256ULL * 1024 * 1024;

struct ZipEntry {
  std::string name;
  std::uint16_t method = 0;
  std::uint32_t crc32 = 0;
  std::uint64_t compressed_size = 0;
  std::uint64_t uncompressed_size = 0;

  [[nodiscard]] bool is_directory() const { return !name.empty() && name.back() == '/'; }
};

/// Reader for the zip container of an extension archive, backed by minizip
/// over an in-memory copy. Supports stored and deflated entries; encrypted
/// entries are rejected.
class ZipArchive {
public:
  [[nodiscard]] static common::Result<ZipArchive> open(const std::filesystem::path &path);
  [[nodiscard]] static common::Result<ZipArchive> from_bytes(std::string bytes);

  [[nodiscard]] const std::vector<ZipEntry> &entries() const { return entries_; }
  [[nodiscard]] const ZipEntry *find(const std::string &name) const;

  /// Streams the entry out in chunks. Output that overruns the declared size,
  /// a declared size over kMaxEntrySize and crc mismatches are all errors.
  [[nodiscard]] common::Result<std::string> read(const ZipEntry &entry) const;

  /// Writes every entry below `destination`. Entries whose path would land
  /// outside it are rejected before anything is written.
  [[nodiscard]] common::Status extract_all(const std::filesystem::path &destination) const;

private:
  ZipArchive(std::string data, std::vector<ZipEntry> entries);

  std::string data_;
  std::vector<ZipEntry> entries_;
};

/// False for absolute names, drive prefixes and names with `..` components.
[[nodiscard]] bool is_safe_entry_name(const std::string &name);

} // namespace wiredrive::driver
