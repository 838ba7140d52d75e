#include "agent_server.hpp"

#include <csignal>
#include <stdexcept>
#include <vector>

#include "agent_session.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

AgentServer::AgentServer(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("rcopyd")) {
  options_.root = absolute_normalized(options_.root, std::filesystem::current_path());
}

AgentServer::~AgentServer() {
  stop();
}

AgentServer::Options AgentServer::options_from(const SettingsManager& settings) {
  Options options;
  options.listen_ip = settings.get<std::string>("listen_ip");
  int port = settings.get<int>("listen_port");
  if(port < 0 || port > 65535) {
    throw std::runtime_error("Invalid listen_port " + std::to_string(port));
  }
  options.listen_port = static_cast<uint16_t>(port);
  options.root = settings.get<std::string>("root");
  return options;
}

void AgentServer::start() {
  if(started_) return;

  std::error_code ec;
  if(!std::filesystem::is_directory(options_.root, ec)) {
    throw std::runtime_error("agent root is not a directory: " + options_.root.string());
  }

  asio::ip::address listen_address;
  try {
    listen_address = asio::ip::make_address(options_.listen_ip);
  } catch(const std::exception& e) {
    logger_->error("Invalid listen_ip '{}': {}", options_.listen_ip, e.what());
    throw;
  }

  acceptor_ = std::make_unique<tcp::acceptor>(io_);
  tcp::endpoint endpoint(listen_address, options_.listen_port);
  acceptor_->open(endpoint.protocol());
  acceptor_->set_option(tcp::acceptor::reuse_address(true));
  acceptor_->bind(endpoint);
  acceptor_->listen();
  listen_port_ = acceptor_->local_endpoint().port();
  started_ = true;

  logger_->info("serving {} on {}:{}", options_.root.string(), options_.listen_ip, listen_port_);
  start_accept();
}

void AgentServer::start_accept() {
  if(!acceptor_) return;
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec == asio::error::operation_aborted) return;
        logger_->error("Accept error: {}", ec.message());
      } else {
        auto session = AgentSession::create(std::move(socket), options_.root, logger_,
          [this](AgentSession* closed){
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            sessions_.erase(closed);
          });
        {
          std::lock_guard<std::mutex> lock(sessions_mutex_);
          sessions_[session.get()] = session;
        }
        session->start();
      }
      if(started_ && acceptor_ && acceptor_->is_open()) {
        start_accept();
      }
    });
}

void AgentServer::stop_on_signals() {
  signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
  signals_->async_wait([this](const std::error_code& ec, int signal_number){
    if(ec) return;
    logger_->info("signal {} received, shutting down", signal_number);
    shutdown();
  });
}

// Runs on the io thread: once the acceptor and every session are closed the
// loop runs out of work and run() returns.
void AgentServer::shutdown() {
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
  if(signals_) {
    std::error_code ec;
    signals_->cancel(ec);
  }
  std::vector<std::shared_ptr<AgentSession>> open_sessions;
  {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for(auto& entry : sessions_) {
      if(auto session = entry.second.lock()) open_sessions.push_back(std::move(session));
    }
  }
  for(auto& session : open_sessions) {
    session->close();
  }
}

void AgentServer::run() {
  if(!started_) start();
  io_.run();
}

void AgentServer::start_background() {
  if(!started_) start();
  if(io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void AgentServer::stop() {
  if(!started_) return;
  started_ = false;

  if(io_thread_.joinable()) {
    asio::post(io_, [this](){ shutdown(); });
    io_thread_.join();
  } else {
    shutdown();
    io_.stop();
  }
  acceptor_.reset();
  signals_.reset();
  io_.restart();
  logger_->info("stopped");
}

std::size_t AgentServer::session_count() const {
  std::lock_guard<std::mutex> lock(sessions_mutex_);
  return sessions_.size();
}
