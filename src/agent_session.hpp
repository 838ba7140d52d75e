#pragma once
#include <asio.hpp>

#include <cstddef>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>

#include "log.hpp"
#include "remote_agent.hpp"

// One accepted client: reads request lines, answers each with one response
// line. Requests are handled in arrival order.
class AgentSession : public std::enable_shared_from_this<AgentSession> {
public:
  using CloseHandler = std::function<void(AgentSession*)>;

  // Base64 of a kMaxWriteLength buffer plus the envelope stays well below this.
  static constexpr std::size_t kMaxLineBytes = 64 * 1024 * 1024;
  static_assert((kMaxWriteLength + 2) / 3 * 4 + 4096 < kMaxLineBytes,
                "a full write request must fit in one line");

  static std::shared_ptr<AgentSession> create(asio::ip::tcp::socket sock,
                                              const std::filesystem::path& root,
                                              std::shared_ptr<Logger> logger,
                                              CloseHandler on_close = nullptr);

  ~AgentSession();

  void start();
  void close();

  const std::string& remote_address() const { return remote_address_; }

private:
  AgentSession(asio::ip::tcp::socket sock,
               const std::filesystem::path& root,
               std::shared_ptr<Logger> logger,
               CloseHandler on_close);

  void do_read();
  void handle_line(const std::string& line);
  void async_send_json(const json& j);
  void do_write();

  asio::ip::tcp::socket socket_;
  std::shared_ptr<Logger> logger_;
  RemoteAgent agent_;
  asio::streambuf read_buf_;
  std::deque<std::string> write_queue_;
  std::string remote_address_;
  CloseHandler on_close_;
  bool closed_ = false;
};
