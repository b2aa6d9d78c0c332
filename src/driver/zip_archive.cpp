#include "wiredrive/driver/zip_archive.hpp"

#include "wiredrive/common/fs.hpp"

#include <algorithm>
#include <cstring>
#include <fstream>

#include <unzip.h>

namespace wiredrive::driver {

namespace {

constexpr std::uint16_t kMethodStored = 0;
constexpr std::uint16_t kMethodDeflated = Z_DEFLATED;
constexpr uLong kFlagEncrypted = 0x0001;
constexpr std::size_t kReadChunkSize = 16 * 1024;
constexpr std::size_t kMaxNameLength = 0xFFFF;

common::Error malformed(const std::string &detail) {
  return common::config_error("malformed extension archive: " + detail);
}

struct MemoryStream {
  const std::string *data = nullptr;
  ZPOS64_T position = 0;
};

voidpf ZCALLBACK memory_open(voidpf opaque, const void * /*filename*/, int /*mode*/) {
  return opaque;
}

uLong ZCALLBACK memory_read(voidpf /*opaque*/, voidpf stream, void *buf, uLong size) {
  auto *memory = static_cast<MemoryStream *>(stream);
  const ZPOS64_T available = memory->data->size() - memory->position;
  const auto count = static_cast<uLong>(std::min<ZPOS64_T>(size, available));
  std::memcpy(buf, memory->data->data() + memory->position, count);
  memory->position += count;
  return count;
}

uLong ZCALLBACK memory_write(voidpf /*opaque*/, voidpf /*stream*/, const void * /*buf*/,
                             uLong /*size*/) {
  return 0;
}

ZPOS64_T ZCALLBACK memory_tell(voidpf /*opaque*/, voidpf stream) {
  return static_cast<MemoryStream *>(stream)->position;
}

long ZCALLBACK memory_seek(voidpf /*opaque*/, voidpf stream, ZPOS64_T offset, int origin) {
  auto *memory = static_cast<MemoryStream *>(stream);
  const ZPOS64_T size = memory->data->size();
  ZPOS64_T base = 0;
  switch (origin) {
  case ZLIB_FILEFUNC_SEEK_SET:
    base = 0;
    break;
  case ZLIB_FILEFUNC_SEEK_CUR:
    base = memory->position;
    break;
  case ZLIB_FILEFUNC_SEEK_END:
    base = size;
    break;
  default:
    return -1;
  }
  if (offset > size - base) {
    return -1;
  }
  memory->position = base + offset;
  return 0;
}

int ZCALLBACK memory_close(voidpf /*opaque*/, voidpf /*stream*/) { return 0; }

int ZCALLBACK memory_error(voidpf /*opaque*/, voidpf /*stream*/) { return 0; }

// An unzFile reading from a borrowed buffer. The buffer must outlive it.
class MemoryUnzip {
public:
  explicit MemoryUnzip(const std::string &data) : stream_{&data, 0} {
    zlib_filefunc64_def functions{};
    functions.zopen64_file = memory_open;
    functions.zread_file = memory_read;
    functions.zwrite_file = memory_write;
    functions.ztell64_file = memory_tell;
    functions.zseek64_file = memory_seek;
    functions.zclose_file = memory_close;
    functions.zerror_file = memory_error;
    functions.opaque = &stream_;
    handle_ = unzOpen2_64("extension.xpi", &functions);
  }

  ~MemoryUnzip() {
    if (handle_ != nullptr) {
      unzClose(handle_);
    }
  }

  MemoryUnzip(const MemoryUnzip &) = delete;
  MemoryUnzip &operator=(const MemoryUnzip &) = delete;

  [[nodiscard]] unzFile get() const { return handle_; }

private:
  MemoryStream stream_;
  unzFile handle_ = nullptr;
};

common::Result<std::vector<ZipEntry>> list_entries(const MemoryUnzip &zip) {
  using ListResult = common::Result<std::vector<ZipEntry>>;

  unz_global_info64 global{};
  if (unzGetGlobalInfo64(zip.get(), &global) != UNZ_OK) {
    return ListResult::failure(malformed("unreadable central directory"));
  }

  std::vector<ZipEntry> entries;
  if (global.number_entry == 0) {
    return ListResult::success(std::move(entries));
  }

  std::vector<char> name(kMaxNameLength + 1, '\0');
  int rc = unzGoToFirstFile(zip.get());
  while (rc == UNZ_OK) {
    unz_file_info64 info{};
    if (unzGetCurrentFileInfo64(zip.get(), &info, name.data(), static_cast<uLong>(name.size()),
                                nullptr, 0, nullptr, 0) != UNZ_OK) {
      return ListResult::failure(malformed("bad central directory entry"));
    }
    ZipEntry entry;
    entry.name.assign(name.data(), std::min<std::size_t>(info.size_filename, kMaxNameLength));
    if ((info.flag & kFlagEncrypted) != 0) {
      return ListResult::failure(malformed("encrypted entry " + entry.name));
    }
    entry.method = static_cast<std::uint16_t>(info.compression_method);
    entry.crc32 = static_cast<std::uint32_t>(info.crc);
    entry.compressed_size = info.compressed_size;
    entry.uncompressed_size = info.uncompressed_size;
    entries.push_back(std::move(entry));
    rc = unzGoToNextFile(zip.get());
  }
  if (rc != UNZ_END_OF_LIST_OF_FILE) {
    return ListResult::failure(malformed("bad central directory entry"));
  }
  return ListResult::success(std::move(entries));
}

} // namespace

bool is_safe_entry_name(const std::string &name) {
  if (name.empty() || name.front() == '/' || name.front() == '\\') {
    return false;
  }
  if (name.size() >= 2 && name[1] == ':') {
    return false;
  }
  std::size_t start = 0;
  while (start <= name.size()) {
    std::size_t end = name.find_first_of("/\\", start);
    if (end == std::string::npos) {
      end = name.size();
    }
    if (name.compare(start, end - start, "..") == 0 && end - start == 2) {
      return false;
    }
    start = end + 1;
  }
  return true;
}

ZipArchive::ZipArchive(std::string data, std::vector<ZipEntry> entries)
    : data_(std::move(data)), entries_(std::move(entries)) {}

common::Result<ZipArchive> ZipArchive::open(const std::filesystem::path &path) {
  auto bytes = common::read_file(path);
  if (!bytes.ok()) {
    return common::Result<ZipArchive>::failure(
        common::config_error("unable to read extension archive: " + path.string()));
  }
  return from_bytes(std::move(bytes.value()));
}

common::Result<ZipArchive> ZipArchive::from_bytes(std::string bytes) {
  common::Result<std::vector<ZipEntry>> entries =
      common::Result<std::vector<ZipEntry>>::failure(malformed("not a zip archive"));
  {
    const MemoryUnzip zip(bytes);
    if (zip.get() != nullptr) {
      entries = list_entries(zip);
    }
  }
  if (!entries.ok()) {
    return common::Result<ZipArchive>::failure(entries.error());
  }
  return common::Result<ZipArchive>::success(
      ZipArchive(std::move(bytes), std::move(entries.value())));
}

const ZipEntry *ZipArchive::find(const std::string &name) const {
  for (const auto &entry : entries_) {
    if (entry.name == name) {
      return &entry;
    }
  }
  return nullptr;
}

common::Result<std::string> ZipArchive::read(const ZipEntry &entry) const {
  using ReadResult = common::Result<std::string>;

  if (entry.method != kMethodStored && entry.method != kMethodDeflated) {
    return ReadResult::failure(malformed("unsupported compression method " +
                                         std::to_string(entry.method) + " for " + entry.name));
  }
  if (entry.uncompressed_size > kMaxEntrySize) {
    return ReadResult::failure(malformed(entry.name + " declares " +
                                         std::to_string(entry.uncompressed_size) +
                                         " bytes, over the entry size limit"));
  }

  const MemoryUnzip zip(data_);
  if (zip.get() == nullptr) {
    return ReadResult::failure(malformed("not a zip archive"));
  }
  if (unzLocateFile(zip.get(), entry.name.c_str(), 1) != UNZ_OK) {
    return ReadResult::failure(malformed("entry not found: " + entry.name));
  }
  if (unzOpenCurrentFile(zip.get()) != UNZ_OK) {
    return ReadResult::failure(malformed("bad local header for " + entry.name));
  }

  std::string content;
  std::vector<char> buffer(kReadChunkSize);
  while (true) {
    const int got =
        unzReadCurrentFile(zip.get(), buffer.data(), static_cast<unsigned>(buffer.size()));
    if (got < 0) {
      unzCloseCurrentFile(zip.get());
      return ReadResult::failure(malformed("corrupt data for " + entry.name));
    }
    if (got == 0) {
      break;
    }
    if (content.size() + static_cast<std::size_t>(got) > entry.uncompressed_size) {
      unzCloseCurrentFile(zip.get());
      return ReadResult::failure(malformed(entry.name + " overruns its declared size"));
    }
    content.append(buffer.data(), static_cast<std::size_t>(got));
  }

  const int closed = unzCloseCurrentFile(zip.get());
  if (closed == UNZ_CRCERROR) {
    return ReadResult::failure(malformed("crc mismatch for " + entry.name));
  }
  if (closed != UNZ_OK) {
    return ReadResult::failure(malformed("unable to finish reading " + entry.name));
  }
  if (content.size() != entry.uncompressed_size) {
    return ReadResult::failure(malformed("size mismatch for " + entry.name + ": declared " +
                                         std::to_string(entry.uncompressed_size) + ", got " +
                                         std::to_string(content.size())));
  }
  return ReadResult::success(std::move(content));
}

common::Status ZipArchive::extract_all(const std::filesystem::path &destination) const {
  const auto root = destination.lexically_normal();
  for (const auto &entry : entries_) {
    const auto target = (root / entry.name).lexically_normal();
    if (!is_safe_entry_name(entry.name) || !common::is_subpath(target, root)) {
      return common::Status::error(
          common::config_error("archive entry escapes the extension directory: " + entry.name));
    }
  }

  for (const auto &entry : entries_) {
    const auto target = (root / entry.name).lexically_normal();
    if (entry.is_directory()) {
      if (auto dir = common::ensure_dir(target); !dir.ok()) {
        return common::Status::error(dir.error());
      }
      continue;
    }
    if (auto dir = common::ensure_dir(target.parent_path()); !dir.ok()) {
      return common::Status::error(dir.error());
    }
    auto content = read(entry);
    if (!content.ok()) {
      return common::Status::error(content.error());
    }
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out) {
      return common::Status::error(common::io_error("unable to create " + target.string()));
    }
    out.write(content.value().data(), static_cast<std::streamsize>(content.value().size()));
    if (!out) {
      return common::Status::error(common::io_error("unable to write " + target.string()));
    }
  }
  return common::Status::success();
}

} // namespace wiredrive::driver
