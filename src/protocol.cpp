#include "protocol.hpp"

#include "utils.hpp"

#include <stdexcept>

namespace {

json make_request(const char* operation) {
  json j;
  j["v"] = kProtocolVersion;
  j["op"] = operation;
  return j;
}

} // namespace

json path_to_json(const std::string& path) {
  if(is_valid_utf8(path)) return path;
  json j;
  j["b64"] = base64_encode(path.data(), path.size());
  return j;
}

std::string path_from_json(const json& j) {
  if(j.is_string()) return j.get<std::string>();
  if(j.is_object() && j.contains("b64") && j["b64"].is_string()) {
    try {
      auto bytes = base64_decode(j["b64"].get<std::string>());
      return std::string(bytes.begin(), bytes.end());
    } catch(const std::invalid_argument& e) {
      throw TransferError(TransferErrorCode::ProtocolError, std::string("bad encoded path: ") + e.what());
    }
  }
  throw TransferError(TransferErrorCode::ProtocolError, "path is neither a string nor an encoded path");
}

json make_hello_request() {
  return make_request(op::kHello);
}

json make_stat_request(const std::string& path) {
  json j = make_request(op::kStat);
  j["path"] = path_to_json(path);
  return j;
}

json make_resolve_request(const std::string& path) {
  json j = make_request(op::kResolve);
  j["path"] = path_to_json(path);
  return j;
}

json make_list_request(const std::string& path) {
  json j = make_request(op::kList);
  j["path"] = path_to_json(path);
  return j;
}

json make_mkdir_request(const std::string& path) {
  json j = make_request(op::kMkdir);
  j["path"] = path_to_json(path);
  j["parents"] = true;
  return j;
}

json make_open_write_request(const std::string& path, WriteMode mode, bool overwrite) {
  json j = make_request(op::kOpenWrite);
  j["path"] = path_to_json(path);
  j["mode"] = write_mode_name(mode);
  j["overwrite"] = overwrite;
  return j;
}

json make_write_request(uint64_t handle, const char* data, std::size_t size) {
  json j = make_request(op::kWrite);
  j["handle"] = handle;
  j["data"] = base64_encode(data, size);
  return j;
}

json make_close_request(uint64_t handle) {
  json j = make_request(op::kClose);
  j["handle"] = handle;
  return j;
}

json make_read_request(const std::string& path, uint64_t offset, std::size_t length) {
  json j = make_request(op::kRead);
  j["path"] = path_to_json(path);
  j["offset"] = offset;
  j["length"] = length;
  return j;
}

json make_ok_response(const json& request) {
  json j;
  j["v"] = kProtocolVersion;
  if(request.contains("id")) j["id"] = request["id"];
  j["ok"] = true;
  return j;
}

json make_fault_response(const json& request, TransferErrorCode code, const std::string& message) {
  json j;
  j["v"] = kProtocolVersion;
  if(request.contains("id")) j["id"] = request["id"];
  j["ok"] = false;
  j["fault"] = error_code_name(code);
  j["error"] = message;
  return j;
}

void check_response(const json& request, const json& response) {
  if(!response.is_object()) {
    throw TransferError(TransferErrorCode::ProtocolError, "response is not an object");
  }
  if(response.value("v", 0) != kProtocolVersion) {
    throw TransferError(TransferErrorCode::ProtocolError,
                        "unsupported protocol version " + std::to_string(response.value("v", 0)));
  }
  if(request.contains("id") && response.value("id", json()) != request["id"]) {
    throw TransferError(TransferErrorCode::ProtocolError, "response id does not match request");
  }
  if(response.value("ok", false)) return;

  std::string message = response.value("error", std::string("remote fault"));
  std::string fault = response.value("fault", std::string());
  std::string path = request.contains("path") ? path_from_json(request["path"]) : std::string();
  auto code = error_code_from_name(fault);
  if(!code) {
    throw TransferError(TransferErrorCode::ProtocolError,
                        "unknown fault '" + fault + "': " + message, path);
  }
  if(*code == TransferErrorCode::SourceNotFound && request.value("op", "") == op::kResolve) {
    throw PathNotFound(path, response.contains("closest") ? path_from_json(response["closest"]) : std::string());
  }
  throw TransferError(*code, message, path);
}

json entry_to_json(const EntryInfo& entry) {
  json j;
  j["name"] = path_to_json(entry.name);
  j["kind"] = entry_kind_name(entry.kind);
  j["size"] = entry.size;
  return j;
}

EntryInfo entry_from_json(const json& j) {
  EntryInfo entry;
  entry.name = j.contains("name") ? path_from_json(j["name"]) : std::string();
  entry.kind = entry_kind_from_name(j.value("kind", std::string()));
  entry.size = j.value("size", uint64_t{0});
  return entry;
}

const char* write_mode_name(WriteMode mode) {
  return mode == WriteMode::Create ? "create" : "append";
}

WriteMode write_mode_from_name(const std::string& name) {
  if(name == "create") return WriteMode::Create;
  if(name == "append") return WriteMode::Append;
  throw TransferError(TransferErrorCode::InvalidRequest, "unknown write mode '" + name + "'");
}
