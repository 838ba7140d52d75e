#include "agent_session.hpp"

#include <istream>
#include <utility>

std::shared_ptr<AgentSession> AgentSession::create(asio::ip::tcp::socket sock,
                                                   const std::filesystem::path& root,
                                                   std::shared_ptr<Logger> logger,
                                                   CloseHandler on_close) {
  return std::shared_ptr<AgentSession>(new AgentSession(std::move(sock), root, std::move(logger),
                                                        std::move(on_close)));
}

AgentSession::AgentSession(asio::ip::tcp::socket sock,
                           const std::filesystem::path& root,
                           std::shared_ptr<Logger> logger,
                           CloseHandler on_close)
  : socket_(std::move(sock)),
    logger_(std::move(logger)),
    agent_(root, logger_),
    read_buf_(kMaxLineBytes),
    on_close_(std::move(on_close)) {
  std::error_code ec;
  auto endpoint = socket_.remote_endpoint(ec);
  remote_address_ = ec ? "unknown" : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

AgentSession::~AgentSession() {
  std::error_code ec;
  socket_.close(ec);
}

void AgentSession::start() {
  logger_->info("session {} opened", remote_address_);
  do_read();
}

void AgentSession::do_read() {
  auto self = shared_from_this();
  asio::async_read_until(socket_, read_buf_, '\n',
    [this, self](std::error_code ec, std::size_t){
      if(ec) {
        if(ec != asio::error::eof && ec != asio::error::operation_aborted) {
          logger_->warn("session {} read error: {}", remote_address_, ec.message());
        }
        close();
        return;
      }
      std::istream is(&read_buf_);
      std::string line;
      std::getline(is, line);
      if(!line.empty()) {
        handle_line(line);
      }
      if(!closed_) do_read();
    });
}

void AgentSession::handle_line(const std::string& line) {
  json request;
  try {
    request = json::parse(line);
  } catch(const json::parse_error& e) {
    logger_->warn("session {} sent unparseable request: {}", remote_address_, e.what());
    async_send_json(make_fault_response(json::object(), TransferErrorCode::ProtocolError,
                                        std::string("unparseable request: ") + e.what()));
    return;
  }
  async_send_json(agent_.handle(request));
}

void AgentSession::async_send_json(const json& j) {
  bool start_write = write_queue_.empty();
  // paths are already encoded by the protocol layer; this only touches
  // free text such as error messages quoting a non UTF-8 file name
  write_queue_.push_back(j.dump(-1, ' ', false, json::error_handler_t::replace) + "\n");
  if(start_write) {
    do_write();
  }
}

void AgentSession::do_write() {
  if(write_queue_.empty() || closed_) return;
  auto self = shared_from_this();
  asio::async_write(socket_, asio::buffer(write_queue_.front()),
    [this, self](std::error_code ec, std::size_t){
      if(ec) {
        if(ec != asio::error::operation_aborted) {
          logger_->warn("session {} write error: {}", remote_address_, ec.message());
        }
        close();
        return;
      }
      write_queue_.pop_front();
      do_write();
    });
}

void AgentSession::close() {
  if(closed_) return;
  closed_ = true;
  std::error_code ec;
  socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);
  agent_.close_all();
  logger_->info("session {} closed", remote_address_);
  if(on_close_) on_close_(this);
}
