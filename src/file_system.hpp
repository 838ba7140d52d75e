#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "transfer_error.hpp"

enum class EntryKind { Directory, File, Symlink, Other };

const char* entry_kind_name(EntryKind kind);
EntryKind entry_kind_from_name(const std::string& name);

struct EntryInfo {
  std::string name;            // last path component; full path for stat()
  EntryKind kind = EntryKind::Other;
  uint64_t size = 0;           // regular files only
};

enum class WriteMode {
  Create,  // create fresh, truncating existing content when overwrite is allowed
  Append   // the file must already exist
};

// resolve_absolute() failure; remembers how far the path did exist.
class PathNotFound : public TransferError {
public:
  PathNotFound(const std::filesystem::path& path, std::filesystem::path closest_existing);

  const std::filesystem::path& closest_existing() const noexcept { return closest_existing_; }

private:
  std::filesystem::path closest_existing_;
};

class ReadStream {
public:
  virtual ~ReadStream() = default;

  // Size captured when the stream was opened.
  virtual uint64_t length() const = 0;

  // May return fewer bytes than asked; 0 means end of stream.
  virtual std::size_t read_some(char* buffer, std::size_t size) = 0;
};

class WriteSink {
public:
  virtual ~WriteSink() = default;

  // Appends one buffer as a single unit of work.
  virtual void write(const char* data, std::size_t size) = 0;

  // Idempotent. Destructors close too but cannot report failure.
  virtual void close() = 0;
};

// Probe and stream primitives for one side of a transfer.
class FileSystem {
public:
  virtual ~FileSystem() = default;

  virtual std::string describe() const = 0;

  // Lexical only; relative paths are anchored at this side's base directory.
  virtual std::filesystem::path make_absolute(const std::filesystem::path& path) const = 0;

  virtual std::optional<EntryInfo> stat(const std::filesystem::path& path) = 0;

  bool exists(const std::filesystem::path& path) { return stat(path).has_value(); }
  bool is_directory(const std::filesystem::path& path) {
    auto info = stat(path);
    return info && info->kind == EntryKind::Directory;
  }

  // Throws PathNotFound.
  virtual std::filesystem::path resolve_absolute(const std::filesystem::path& path) = 0;

  // Non-recursive, hidden entries included, symlinks reported as Symlink.
  virtual std::vector<EntryInfo> list_entries(const std::filesystem::path& directory) = 0;

  // Returns true when at least one directory was created.
  virtual bool make_directories(const std::filesystem::path& path) = 0;

  virtual std::unique_ptr<ReadStream> open_read(const std::filesystem::path& path) = 0;

  // Largest size one WriteSink::write call accepts, when this side has one.
  virtual std::optional<std::size_t> max_write_size() const { return std::nullopt; }

  // Single attempt. Throws TransferErrorCode::Locked when another handle holds
  // the file, DestinationExists for Create without overwrite on an existing file.
  virtual std::unique_ptr<WriteSink> open_for_write(const std::filesystem::path& path,
                                                    WriteMode mode,
                                                    bool overwrite) = 0;
};
