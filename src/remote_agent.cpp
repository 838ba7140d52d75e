#include "remote_agent.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

std::string op_of(const json& request) {
  if(!request.is_object()) return "?";
  auto it = request.find("op");
  return it != request.end() && it->is_string() ? it->get<std::string>() : "?";
}

} // namespace

RemoteAgent::RemoteAgent(fs::path root, std::shared_ptr<Logger> logger)
  : fs_(std::move(root)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("agent")) {}

RemoteAgent::~RemoteAgent() {
  close_all();
}

void RemoteAgent::close_all() {
  for(auto& entry : sinks_) {
    try {
      entry.second.sink->close();
    } catch(const TransferError& e) {
      logger_->warn("closing {} failed: {}", entry.second.path.string(), e.what());
    }
    logger_->debug("handle {} for {} closed on shutdown", entry.first, entry.second.path.string());
  }
  sinks_.clear();
}

json RemoteAgent::handle(const json& request) {
  try {
    if(!request.is_object()) {
      throw TransferError(TransferErrorCode::ProtocolError, "request is not an object");
    }
    int version = request.value("v", 0);
    if(version != kProtocolVersion) {
      throw TransferError(TransferErrorCode::ProtocolError,
                          "unsupported protocol version " + std::to_string(version));
    }
    return dispatch(request);
  } catch(const PathNotFound& e) {
    auto response = make_fault_response(request, e.code(), e.what());
    response["closest"] = path_to_json(e.closest_existing().string());
    return response;
  } catch(const TransferError& e) {
    logger_->debug("{} failed: {}", op_of(request), e.what());
    return make_fault_response(request, e.code(), e.what());
  } catch(const json::exception& e) {
    return make_fault_response(request, TransferErrorCode::InvalidRequest,
                               std::string("malformed request: ") + e.what());
  } catch(const std::invalid_argument& e) {
    return make_fault_response(request, TransferErrorCode::InvalidRequest, e.what());
  } catch(const std::exception& e) {
    logger_->error("{} failed: {}", op_of(request), e.what());
    return make_fault_response(request, TransferErrorCode::IoError, e.what());
  }
}

json RemoteAgent::dispatch(const json& request) {
  const std::string operation = request.value("op", "");
  if(operation == op::kHello) return do_hello(request);
  if(operation == op::kStat) return do_stat(request);
  if(operation == op::kResolve) return do_resolve(request);
  if(operation == op::kList) return do_list(request);
  if(operation == op::kMkdir) return do_mkdir(request);
  if(operation == op::kOpenWrite) return do_open_write(request);
  if(operation == op::kWrite) return do_write(request);
  if(operation == op::kClose) return do_close(request);
  if(operation == op::kRead) return do_read(request);
  throw TransferError(TransferErrorCode::InvalidRequest, "unknown op '" + operation + "'");
}

fs::path RemoteAgent::request_path(const json& request) const {
  std::string path = path_from_json(request.at("path"));
  if(path.empty()) {
    throw TransferError(TransferErrorCode::InvalidRequest, "empty path");
  }
  return fs_.make_absolute(path);
}

RemoteAgent::OpenSink& RemoteAgent::sink_for(const json& request) {
  auto id = request.at("handle").get<uint64_t>();
  auto it = sinks_.find(id);
  if(it == sinks_.end()) {
    throw TransferError(TransferErrorCode::InvalidRequest, "unknown handle " + std::to_string(id));
  }
  return it->second;
}

json RemoteAgent::do_hello(const json& request) {
  auto response = make_ok_response(request);
  response["agent"] = "rcopyd";
  response["root"] = path_to_json(root().string());
  response["max_write"] = kMaxWriteLength;
  return response;
}

json RemoteAgent::do_stat(const json& request) {
  auto info = fs_.stat(request_path(request));
  auto response = make_ok_response(request);
  response["exists"] = info.has_value();
  if(info) {
    response["kind"] = entry_kind_name(info->kind);
    response["size"] = info->size;
  }
  return response;
}

json RemoteAgent::do_resolve(const json& request) {
  auto response = make_ok_response(request);
  response["path"] = path_to_json(fs_.resolve_absolute(request_path(request)).string());
  return response;
}

json RemoteAgent::do_list(const json& request) {
  auto entries = fs_.list_entries(request_path(request));
  json arr = json::array();
  for(const auto& entry : entries) {
    arr.push_back(entry_to_json(entry));
  }
  auto response = make_ok_response(request);
  response["entries"] = std::move(arr);
  return response;
}

json RemoteAgent::do_mkdir(const json& request) {
  auto path = request_path(request);
  bool created = false;
  if(request.value("parents", true)) {
    created = fs_.make_directories(path);
  } else {
    auto parent = path.parent_path();
    if(!parent.empty() && !fs_.is_directory(parent)) {
      throw TransferError(TransferErrorCode::DestinationFolderMissing,
                          "destination folder missing: " + parent.string(), path);
    }
    created = fs_.make_directories(path);
  }
  auto response = make_ok_response(request);
  response["created"] = created;
  return response;
}

json RemoteAgent::do_open_write(const json& request) {
  auto path = request_path(request);
  auto mode = write_mode_from_name(request.value("mode", std::string("create")));
  bool overwrite = request.value("overwrite", false);

  OpenSink entry;
  entry.path = path;
  entry.sink = fs_.open_for_write(path, mode, overwrite);
  uint64_t id = next_handle_++;
  sinks_.emplace(id, std::move(entry));
  logger_->debug("handle {} opened for {} ({})", id, path.string(), write_mode_name(mode));

  auto response = make_ok_response(request);
  response["handle"] = id;
  return response;
}

json RemoteAgent::do_write(const json& request) {
  auto& entry = sink_for(request);
  auto data = base64_decode(request.at("data").get<std::string>());
  if(data.size() > kMaxWriteLength) {
    throw TransferError(TransferErrorCode::InvalidRequest,
                        "write of " + std::to_string(data.size()) + " bytes exceeds the limit of " +
                        std::to_string(kMaxWriteLength), entry.path);
  }
  entry.sink->write(data.data(), data.size());
  entry.written += data.size();
  auto response = make_ok_response(request);
  response["size"] = entry.written;
  return response;
}

json RemoteAgent::do_close(const json& request) {
  auto id = request.at("handle").get<uint64_t>();
  auto it = sinks_.find(id);
  if(it == sinks_.end()) {
    throw TransferError(TransferErrorCode::InvalidRequest, "unknown handle " + std::to_string(id));
  }
  OpenSink entry = std::move(it->second);
  sinks_.erase(it);
  entry.sink->close();
  logger_->debug("handle {} closed after {} bytes", id, entry.written);
  return make_ok_response(request);
}

json RemoteAgent::do_read(const json& request) {
  auto path = request_path(request);
  uint64_t offset = request.value("offset", uint64_t{0});
  std::size_t length = request.value("length", kMaxReadLength);

  auto info = fs_.stat(path);
  if(!info) {
    throw TransferError(TransferErrorCode::SourceNotFound, "source not found: " + path.string(), path);
  }
  if(info->kind != EntryKind::File) {
    throw TransferError(TransferErrorCode::IoError, "not a regular file: " + path.string(), path);
  }

  auto response = make_ok_response(request);
  if(offset >= info->size) {
    response["data"] = "";
    response["eof"] = true;
    return response;
  }

  std::size_t clamped = std::min<std::size_t>(length ? length : kMaxReadLength,
                                              static_cast<std::size_t>(info->size - offset));
  clamped = std::min(clamped, kMaxReadLength);

  std::ifstream file(path, std::ios::binary);
  if(!file) {
    throw TransferError(TransferErrorCode::IoError, "cannot open " + path.string(), path);
  }
  file.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  std::vector<char> buffer(clamped);
  file.read(buffer.data(), static_cast<std::streamsize>(clamped));
  std::streamsize read_bytes = file.gcount();
  if(read_bytes < 0) read_bytes = 0;
  buffer.resize(static_cast<std::size_t>(read_bytes));

  response["data"] = base64_encode(buffer);
  response["eof"] = offset + buffer.size() >= info->size;
  return response;
}
