#include "local_file_system.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

std::string errno_message(const std::string& what, const fs::path& path, int err) {
  return what + " " + path.string() + ": " + std::strerror(err);
}

class LocalReadStream : public ReadStream {
public:
  LocalReadStream(int fd, uint64_t length, fs::path path)
    : fd_(fd), length_(length), path_(std::move(path)) {}

  ~LocalReadStream() override {
    if(fd_ >= 0) ::close(fd_);
  }

  uint64_t length() const override { return length_; }

  std::size_t read_some(char* buffer, std::size_t size) override {
    while(true) {
      ssize_t n = ::read(fd_, buffer, size);
      if(n >= 0) return static_cast<std::size_t>(n);
      if(errno == EINTR) continue;
      throw TransferError(TransferErrorCode::IoError, errno_message("read failed on", path_, errno), path_);
    }
  }

private:
  int fd_;
  uint64_t length_;
  fs::path path_;
};

class LocalWriteSink : public WriteSink {
public:
  LocalWriteSink(int fd, fs::path path) : fd_(fd), path_(std::move(path)) {}

  ~LocalWriteSink() override {
    // error already surfaced through close() on the success path
    if(fd_ >= 0) ::close(fd_);
  }

  void write(const char* data, std::size_t size) override {
    if(fd_ < 0) {
      throw TransferError(TransferErrorCode::IoError, "write after close: " + path_.string(), path_);
    }
    std::size_t written = 0;
    while(written < size) {
      ssize_t n = ::write(fd_, data + written, size - written);
      if(n < 0) {
        if(errno == EINTR) continue;
        throw TransferError(TransferErrorCode::IoError, errno_message("write failed on", path_, errno), path_);
      }
      written += static_cast<std::size_t>(n);
    }
  }

  void close() override {
    if(fd_ < 0) return;
    int fd = fd_;
    fd_ = -1;
    if(::close(fd) != 0) {
      throw TransferError(TransferErrorCode::IoError, errno_message("close failed on", path_, errno), path_);
    }
  }

private:
  int fd_;
  fs::path path_;
};

EntryKind kind_of(const fs::file_status& status) {
  if(fs::is_symlink(status)) return EntryKind::Symlink;
  if(fs::is_directory(status)) return EntryKind::Directory;
  if(fs::is_regular_file(status)) return EntryKind::File;
  return EntryKind::Other;
}

} // namespace

const char* entry_kind_name(EntryKind kind) {
  switch(kind) {
    case EntryKind::Directory: return "dir";
    case EntryKind::File: return "file";
    case EntryKind::Symlink: return "symlink";
    case EntryKind::Other: return "other";
  }
  return "other";
}

EntryKind entry_kind_from_name(const std::string& name) {
  if(name == "dir") return EntryKind::Directory;
  if(name == "file") return EntryKind::File;
  if(name == "symlink") return EntryKind::Symlink;
  return EntryKind::Other;
}

PathNotFound::PathNotFound(const fs::path& path, fs::path closest_existing)
  : TransferError(TransferErrorCode::SourceNotFound,
                  "path not found: " + path.string() +
                  (closest_existing.empty() ? std::string() : " (closest existing: " + closest_existing.string() + ")"),
                  path),
    closest_existing_(std::move(closest_existing)) {}

LocalFileSystem::LocalFileSystem(fs::path base_directory)
  : base_directory_(absolute_normalized(base_directory, fs::current_path())) {}

std::string LocalFileSystem::describe() const {
  return "local";
}

fs::path LocalFileSystem::make_absolute(const fs::path& path) const {
  return absolute_normalized(path, base_directory_);
}

std::optional<EntryInfo> LocalFileSystem::stat(const fs::path& path) {
  auto abs = make_absolute(path);
  std::error_code ec;
  // the path itself is followed; only entries found by list_entries report Symlink
  auto status = fs::status(abs, ec);
  if(ec || !fs::exists(status)) return std::nullopt;
  EntryInfo info;
  info.name = abs.filename().string();
  info.kind = kind_of(status);
  if(info.kind == EntryKind::File) {
    auto size = fs::file_size(abs, ec);
    if(!ec) info.size = size;
  }
  return info;
}

fs::path LocalFileSystem::resolve_absolute(const fs::path& path) {
  auto abs = make_absolute(path);
  std::error_code ec;
  if(fs::exists(abs, ec)) return abs;
  fs::path probe = abs.parent_path();
  while(!probe.empty()) {
    if(fs::exists(probe, ec)) break;
    if(probe == probe.root_path()) {
      probe.clear();
      break;
    }
    probe = probe.parent_path();
  }
  throw PathNotFound(abs, probe);
}

std::vector<EntryInfo> LocalFileSystem::list_entries(const fs::path& directory) {
  auto abs = make_absolute(directory);
  std::error_code ec;
  fs::directory_iterator it(abs, ec);
  if(ec) {
    auto code = (ec == std::errc::no_such_file_or_directory)
      ? TransferErrorCode::SourceNotFound
      : TransferErrorCode::IoError;
    throw TransferError(code, "cannot list " + abs.string() + ": " + ec.message(), abs);
  }
  std::vector<EntryInfo> entries;
  for(; it != fs::directory_iterator(); it.increment(ec)) {
    if(ec) {
      throw TransferError(TransferErrorCode::IoError,
                          "listing " + abs.string() + " interrupted: " + ec.message(), abs);
    }
    EntryInfo info;
    info.name = it->path().filename().string();
    std::error_code entry_ec;
    auto status = it->symlink_status(entry_ec);
    info.kind = entry_ec ? EntryKind::Other : kind_of(status);
    if(info.kind == EntryKind::File) {
      auto size = it->file_size(entry_ec);
      if(!entry_ec) info.size = size;
    }
    entries.push_back(std::move(info));
  }
  if(ec) {
    throw TransferError(TransferErrorCode::IoError,
                        "listing " + abs.string() + " interrupted: " + ec.message(), abs);
  }
  return entries;
}

bool LocalFileSystem::make_directories(const fs::path& path) {
  auto abs = make_absolute(path);
  std::error_code ec;
  bool created = fs::create_directories(abs, ec);
  if(ec) {
    if(fs::is_directory(abs)) return false;
    throw TransferError(TransferErrorCode::IoError,
                        "cannot create directory " + abs.string() + ": " + ec.message(), abs);
  }
  return created;
}

std::unique_ptr<ReadStream> LocalFileSystem::open_read(const fs::path& path) {
  auto abs = make_absolute(path);
  int fd = ::open(abs.c_str(), O_RDONLY | O_CLOEXEC);
  if(fd < 0) {
    int err = errno;
    auto code = err == ENOENT ? TransferErrorCode::SourceNotFound : TransferErrorCode::IoError;
    throw TransferError(code, errno_message("cannot open", abs, err), abs);
  }
  struct stat st{};
  if(::fstat(fd, &st) != 0) {
    int err = errno;
    ::close(fd);
    throw TransferError(TransferErrorCode::IoError, errno_message("cannot stat", abs, err), abs);
  }
  if(!S_ISREG(st.st_mode)) {
    ::close(fd);
    throw TransferError(TransferErrorCode::IoError, "not a regular file: " + abs.string(), abs);
  }
  return std::make_unique<LocalReadStream>(fd, static_cast<uint64_t>(st.st_size), abs);
}

std::unique_ptr<WriteSink> LocalFileSystem::open_for_write(const fs::path& path,
                                                           WriteMode mode,
                                                           bool overwrite) {
  auto abs = make_absolute(path);
  int flags = O_WRONLY | O_CLOEXEC;
  if(mode == WriteMode::Create) {
    // no O_TRUNC: content is only dropped once the lock is ours
    flags |= O_CREAT;
    if(!overwrite) flags |= O_EXCL;
  } else {
    flags |= O_APPEND;
  }
  int fd = ::open(abs.c_str(), flags, 0644);
  if(fd < 0) {
    int err = errno;
    switch(err) {
      case EEXIST:
        throw TransferError(TransferErrorCode::DestinationExists,
                            "destination exists: " + abs.string(), abs);
      case ETXTBSY:
        throw TransferError(TransferErrorCode::Locked, errno_message("cannot open", abs, err), abs);
      case ENOENT:
        if(mode == WriteMode::Create) {
          throw TransferError(TransferErrorCode::DestinationFolderMissing,
                              "destination folder missing: " + abs.parent_path().string(), abs);
        }
        throw TransferError(TransferErrorCode::IoError, errno_message("cannot append to", abs, err), abs);
      default:
        throw TransferError(TransferErrorCode::IoError, errno_message("cannot open", abs, err), abs);
    }
  }
  if(::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    int err = errno;
    ::close(fd);
    if(err == EWOULDBLOCK) {
      throw TransferError(TransferErrorCode::Locked, "destination is locked: " + abs.string(), abs);
    }
    throw TransferError(TransferErrorCode::IoError, errno_message("cannot lock", abs, err), abs);
  }
  if(mode == WriteMode::Create && overwrite && ::ftruncate(fd, 0) != 0) {
    int err = errno;
    ::close(fd);
    throw TransferError(TransferErrorCode::IoError, errno_message("cannot truncate", abs, err), abs);
  }
  return std::make_unique<LocalWriteSink>(fd, abs);
}
