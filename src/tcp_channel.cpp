#include "tcp_channel.hpp"

#include <istream>
#include <utility>

TcpChannel::TcpChannel(std::string host, uint16_t port, std::shared_ptr<Logger> logger)
  : host_(std::move(host)),
    port_(port),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("tcp-channel")),
    socket_(io_) {
  try {
    tcp::resolver resolver(io_);
    auto endpoints = resolver.resolve(host_, std::to_string(port_));
    auto endpoint = asio::connect(socket_, endpoints);
    socket_.set_option(tcp::no_delay(true));
    logger_->debug("connected to {}:{}", endpoint.address().to_string(), endpoint.port());
  } catch(const asio::system_error& e) {
    throw TransferError(TransferErrorCode::ChannelFault,
                        "cannot connect to " + describe() + ": " + e.what());
  }
}

TcpChannel::~TcpChannel() {
  close();
}

std::string TcpChannel::describe() const {
  return host_ + ":" + std::to_string(port_);
}

void TcpChannel::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if(!socket_.is_open()) return;
  std::error_code ec;
  socket_.shutdown(tcp::socket::shutdown_both, ec);
  socket_.close(ec);
}

bool TcpChannel::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return socket_.is_open() && !broken_;
}

void TcpChannel::fail(const std::string& what) {
  broken_ = true;
  std::error_code ec;
  socket_.close(ec);
  logger_->error("{}: {}", describe(), what);
  throw TransferError(TransferErrorCode::ChannelFault, describe() + ": " + what);
}

json TcpChannel::execute(const json& request) {
  std::lock_guard<std::mutex> lock(mutex_);
  if(broken_ || !socket_.is_open()) {
    throw TransferError(TransferErrorCode::ChannelFault, describe() + ": channel is closed");
  }

  std::string line;
  try {
    line = request.dump() + "\n";
  } catch(const json::type_error& e) {
    // nothing was sent, so the channel is still usable
    throw TransferError(TransferErrorCode::ProtocolError,
                        std::string("request cannot be encoded: ") + e.what());
  }
  std::error_code ec;
  asio::write(socket_, asio::buffer(line), ec);
  if(ec) fail("write failed: " + ec.message());

  asio::read_until(socket_, read_buf_, '\n', ec);
  if(ec) fail("read failed: " + ec.message());

  std::istream is(&read_buf_);
  std::string response_line;
  std::getline(is, response_line);
  try {
    return json::parse(response_line);
  } catch(const json::parse_error& e) {
    fail(std::string("unparseable response: ") + e.what());
  }
}
