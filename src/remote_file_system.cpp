#include "remote_file_system.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <utility>

#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

std::vector<char> decode_payload(const json& response, const fs::path& path) {
  try {
    return base64_decode(response.value("data", std::string()));
  } catch(const std::invalid_argument& e) {
    throw TransferError(TransferErrorCode::ProtocolError,
                        std::string("bad data payload: ") + e.what(), path);
  }
}

class RemoteReadStream : public ReadStream {
public:
  RemoteReadStream(std::shared_ptr<RemoteChannel> channel, fs::path path, uint64_t length)
    : channel_(std::move(channel)), path_(std::move(path)), length_(length) {}

  uint64_t length() const override { return length_; }

  std::size_t read_some(char* buffer, std::size_t size) override {
    if(size == 0 || eof_) return 0;
    auto response = channel_->call(make_read_request(path_.string(), offset_,
                                                     std::min(size, kMaxReadLength)));
    auto data = decode_payload(response, path_);
    if(data.size() > size) {
      throw TransferError(TransferErrorCode::ProtocolError,
                          "read returned " + std::to_string(data.size()) + " bytes, asked for " +
                          std::to_string(size), path_);
    }
    std::memcpy(buffer, data.data(), data.size());
    offset_ += data.size();
    eof_ = data.empty() || response.value("eof", false);
    return data.size();
  }

private:
  std::shared_ptr<RemoteChannel> channel_;
  fs::path path_;
  uint64_t length_ = 0;
  uint64_t offset_ = 0;
  bool eof_ = false;
};

class RemoteWriteSink : public WriteSink {
public:
  RemoteWriteSink(std::shared_ptr<RemoteChannel> channel, fs::path path, uint64_t handle)
    : channel_(std::move(channel)), path_(std::move(path)), handle_(handle) {}

  ~RemoteWriteSink() override {
    if(!open_) return;
    try {
      channel_->call(make_close_request(handle_));
    } catch(const TransferError& e) {
      log_warn(nullptr, "closing {} failed: {}", path_.string(), e.what());
    }
  }

  void write(const char* data, std::size_t size) override {
    if(!open_) {
      throw TransferError(TransferErrorCode::IoError, "write after close: " + path_.string(), path_);
    }
    channel_->call(make_write_request(handle_, data, size));
  }

  void close() override {
    if(!open_) return;
    open_ = false;
    channel_->call(make_close_request(handle_));
  }

private:
  std::shared_ptr<RemoteChannel> channel_;
  fs::path path_;
  uint64_t handle_ = 0;
  bool open_ = true;
};

} // namespace

RemoteFileSystem::RemoteFileSystem(std::shared_ptr<RemoteChannel> channel)
  : channel_(std::move(channel)) {
  if(!channel_) {
    throw TransferError(TransferErrorCode::InvalidRequest, "remote file system needs a channel");
  }
  auto response = channel_->call(make_hello_request());
  root_ = response.contains("root") ? path_from_json(response["root"]) : std::string("/");
  // agents that predate "max_write" accept the protocol default
  max_write_ = response.value("max_write", kMaxWriteLength);
  if(max_write_ == 0) {
    throw TransferError(TransferErrorCode::ProtocolError, "agent advertises a zero write limit");
  }
  if(!root_.is_absolute()) {
    throw TransferError(TransferErrorCode::ProtocolError, "agent root is not absolute: " + root_.string());
  }
}

std::string RemoteFileSystem::describe() const {
  return "remote(" + channel_->describe() + ")";
}

fs::path RemoteFileSystem::make_absolute(const fs::path& path) const {
  return absolute_normalized(path, root_);
}

std::optional<EntryInfo> RemoteFileSystem::stat(const fs::path& path) {
  auto abs = make_absolute(path);
  auto response = channel_->call(make_stat_request(abs.string()));
  if(!response.value("exists", false)) return std::nullopt;
  EntryInfo info;
  info.name = abs.filename().string();
  info.kind = entry_kind_from_name(response.value("kind", std::string()));
  info.size = response.value("size", uint64_t{0});
  return info;
}

fs::path RemoteFileSystem::resolve_absolute(const fs::path& path) {
  auto response = channel_->call(make_resolve_request(make_absolute(path).string()));
  if(!response.contains("path")) {
    throw TransferError(TransferErrorCode::ProtocolError, "resolve response without a path");
  }
  return fs::path(path_from_json(response["path"]));
}

std::vector<EntryInfo> RemoteFileSystem::list_entries(const fs::path& directory) {
  auto response = channel_->call(make_list_request(make_absolute(directory).string()));
  std::vector<EntryInfo> entries;
  for(const auto& item : response.value("entries", json::array())) {
    entries.push_back(entry_from_json(item));
  }
  return entries;
}

bool RemoteFileSystem::make_directories(const fs::path& path) {
  auto response = channel_->call(make_mkdir_request(make_absolute(path).string()));
  return response.value("created", false);
}

std::unique_ptr<ReadStream> RemoteFileSystem::open_read(const fs::path& path) {
  auto abs = make_absolute(path);
  auto info = stat(abs);
  if(!info) {
    throw TransferError(TransferErrorCode::SourceNotFound, "cannot open " + abs.string(), abs);
  }
  if(info->kind != EntryKind::File) {
    throw TransferError(TransferErrorCode::IoError, "not a regular file: " + abs.string(), abs);
  }
  return std::make_unique<RemoteReadStream>(channel_, abs, info->size);
}

std::unique_ptr<WriteSink> RemoteFileSystem::open_for_write(const fs::path& path,
                                                            WriteMode mode,
                                                            bool overwrite) {
  auto abs = make_absolute(path);
  auto response = channel_->call(make_open_write_request(abs.string(), mode, overwrite));
  if(!response.contains("handle")) {
    throw TransferError(TransferErrorCode::ProtocolError, "open_write response carries no handle", abs);
  }
  return std::make_unique<RemoteWriteSink>(channel_, abs, response["handle"].get<uint64_t>());
}
