#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "log.hpp"
#include "protocol.hpp"

class RemoteAgent;

// Carries one request to the remote side and brings its response back.
// Synchronous and blocking.
class RemoteChannel {
public:
  virtual ~RemoteChannel() = default;

  virtual std::string describe() const = 0;

  // Throws ChannelFault when no response could be obtained. Fault responses
  // come back as values.
  virtual json execute(const json& request) = 0;

  // Stamps a request id, executes, and converts fault responses to exceptions.
  json call(json request);

private:
  std::atomic<uint64_t> next_id_{1};
};

// In-process channel straight into a RemoteAgent. Used for local-to-local
// copies and by the test runners.
class LoopbackChannel : public RemoteChannel {
public:
  explicit LoopbackChannel(std::filesystem::path root, std::shared_ptr<Logger> logger = nullptr);
  ~LoopbackChannel() override;

  std::string describe() const override;
  json execute(const json& request) override;

private:
  std::mutex mutex_;
  std::unique_ptr<RemoteAgent> agent_;
};
