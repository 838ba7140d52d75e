#pragma once

#include <asio.hpp>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "log.hpp"
#include "remote_channel.hpp"

// Blocking client side of the agent protocol. Requests are serialised, so one
// channel may be shared between threads. Any socket error breaks the channel
// for good and surfaces as ChannelFault.
class TcpChannel : public RemoteChannel {
public:
  TcpChannel(std::string host, uint16_t port, std::shared_ptr<Logger> logger = nullptr);
  ~TcpChannel() override;

  std::string describe() const override;
  json execute(const json& request) override;

  void close();
  bool is_open() const;

private:
  using tcp = asio::ip::tcp;

  [[noreturn]] void fail(const std::string& what);

  std::string host_;
  uint16_t port_ = 0;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  tcp::socket socket_;
  asio::streambuf read_buf_;
  mutable std::mutex mutex_;
  bool broken_ = false;
};
