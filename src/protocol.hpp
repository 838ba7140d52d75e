#pragma once
#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "file_system.hpp"
#include "transfer_error.hpp"

using json = nlohmann::json;

// protocol.hpp
// One JSON object per line. Requests carry "op"; responses carry "ok" and,
// on failure, "fault" (an error_code_name()) and "error".
//
// Paths and entry names are raw bytes. Valid UTF-8 travels as a plain JSON
// string, anything else as {"b64": <base64 of the bytes>}.
inline constexpr int kProtocolVersion = 1;
inline constexpr std::size_t kMaxReadLength = 1024 * 1024;
// Largest payload one write request may carry. Its base64 line stays well
// under the agent's line limit; hello advertises it as "max_write".
inline constexpr std::size_t kMaxWriteLength = 32 * 1024 * 1024;

namespace op {
inline constexpr const char* kHello = "hello";
inline constexpr const char* kStat = "stat";
inline constexpr const char* kResolve = "resolve";
inline constexpr const char* kList = "list";
inline constexpr const char* kMkdir = "mkdir";
inline constexpr const char* kOpenWrite = "open_write";
inline constexpr const char* kWrite = "write";
inline constexpr const char* kClose = "close";
inline constexpr const char* kRead = "read";
} // namespace op

json path_to_json(const std::string& path);
// Throws ProtocolError for anything that is neither form.
std::string path_from_json(const json& j);

json make_hello_request();
json make_stat_request(const std::string& path);
json make_resolve_request(const std::string& path);
json make_list_request(const std::string& path);
json make_mkdir_request(const std::string& path);
json make_open_write_request(const std::string& path, WriteMode mode, bool overwrite);
json make_write_request(uint64_t handle, const char* data, std::size_t size);
json make_close_request(uint64_t handle);
json make_read_request(const std::string& path, uint64_t offset, std::size_t length);

json make_ok_response(const json& request);
json make_fault_response(const json& request, TransferErrorCode code, const std::string& message);

// Throws the TransferError described by a fault response (PathNotFound for a
// failed resolve) and ProtocolError for malformed or mismatched responses.
void check_response(const json& request, const json& response);

json entry_to_json(const EntryInfo& entry);
EntryInfo entry_from_json(const json& j);

const char* write_mode_name(WriteMode mode);
WriteMode write_mode_from_name(const std::string& name);
