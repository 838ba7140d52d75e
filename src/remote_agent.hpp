#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>

#include "local_file_system.hpp"
#include "log.hpp"
#include "protocol.hpp"

// Executes channel requests against the file system of the machine it runs
// on. One instance per connection: open write handles belong to it and are
// closed when it goes away.
class RemoteAgent {
public:
  explicit RemoteAgent(std::filesystem::path root, std::shared_ptr<Logger> logger = nullptr);
  ~RemoteAgent();

  RemoteAgent(const RemoteAgent&) = delete;
  RemoteAgent& operator=(const RemoteAgent&) = delete;

  // Never throws for a bad request; failures come back as fault responses.
  json handle(const json& request);

  const std::filesystem::path& root() const { return fs_.base_directory(); }
  std::size_t open_handles() const { return sinks_.size(); }
  void close_all();

private:
  struct OpenSink {
    std::filesystem::path path;
    std::unique_ptr<WriteSink> sink;
    uint64_t written = 0;
  };

  json dispatch(const json& request);
  std::filesystem::path request_path(const json& request) const;
  OpenSink& sink_for(const json& request);

  json do_hello(const json& request);
  json do_stat(const json& request);
  json do_resolve(const json& request);
  json do_list(const json& request);
  json do_mkdir(const json& request);
  json do_open_write(const json& request);
  json do_write(const json& request);
  json do_close(const json& request);
  json do_read(const json& request);

  LocalFileSystem fs_;
  std::unordered_map<uint64_t, OpenSink> sinks_;
  uint64_t next_handle_ = 1;
  std::shared_ptr<Logger> logger_;
};
