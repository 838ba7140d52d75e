#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "log.hpp"

class AgentSession;
class SettingsManager;

// TCP front end of the remote agent: accepts clients and gives each one its
// own session. run() blocks; start_background() runs the loop on a thread.
class AgentServer {
public:
  struct Options {
    std::string listen_ip = "127.0.0.1";
    uint16_t listen_port = 0;  // 0 picks a free port
    std::filesystem::path root = std::filesystem::current_path();
  };

  explicit AgentServer(Options options, std::shared_ptr<Logger> logger = nullptr);
  ~AgentServer();

  // Reads listen_ip, listen_port and root from the rcopyd settings table.
  static Options options_from(const SettingsManager& settings);

  void start();
  void run();
  void start_background();
  void stop();

  // SIGINT/SIGTERM end run().
  void stop_on_signals();

  uint16_t listen_port() const { return listen_port_; }
  const std::filesystem::path& root() const { return options_.root; }
  std::size_t session_count() const;
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  using tcp = asio::ip::tcp;

  void start_accept();
  void shutdown();

  Options options_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::unique_ptr<asio::signal_set> signals_;
  mutable std::mutex sessions_mutex_;
  std::unordered_map<AgentSession*, std::weak_ptr<AgentSession>> sessions_;
  std::atomic<bool> started_{false};
  uint16_t listen_port_ = 0;
};
