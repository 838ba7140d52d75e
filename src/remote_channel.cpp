#include "remote_channel.hpp"

#include <utility>

#include "remote_agent.hpp"

json RemoteChannel::call(json request) {
  request["id"] = next_id_.fetch_add(1);
  auto response = execute(request);
  check_response(request, response);
  return response;
}

LoopbackChannel::LoopbackChannel(std::filesystem::path root, std::shared_ptr<Logger> logger)
  : agent_(std::make_unique<RemoteAgent>(std::move(root), std::move(logger))) {}

LoopbackChannel::~LoopbackChannel() = default;

std::string LoopbackChannel::describe() const {
  return "loopback:" + agent_->root().string();
}

json LoopbackChannel::execute(const json& request) {
  std::lock_guard<std::mutex> lock(mutex_);
  return agent_->handle(request);
}
