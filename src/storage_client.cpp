#include "storage_client.hpp"

#include <istream>

#include "config_store.hpp"
#include "protocol.hpp"

StorageClient::StorageClient(std::string host,
                             std::chrono::milliseconds timeout,
                             std::shared_ptr<Logger> logger)
  : host_(std::move(host)),
    timeout_(timeout),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("storage-client")),
    socket_(io_) {}

StorageClient::~StorageClient() {
  close();
}

void StorageClient::close() {
  if(socket_.is_open()) {
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
  }
  connected_ = false;
}

// Closing the socket aborts whatever is still queued; running the context
// afterwards lets those handlers finish before the state they capture goes away.
void StorageClient::abandon_pending() {
  std::error_code ec;
  socket_.close(ec);
  connected_ = false;
  io_.restart();
  io_.run();
}

bool StorageClient::connect(const std::string& service, std::string& error) {
  std::string host;
  unsigned short port = 0;
  if(!parse_service_address(host_, host, port, error)) {
    return false;
  }

  asio::ip::tcp::resolver resolver(io_);
  std::error_code resolve_ec;
  const auto endpoints = resolver.resolve(host, std::to_string(port), resolve_ec);
  if(resolve_ec) {
    error = "unable to resolve " + host_ + ": " + resolve_ec.message();
    return false;
  }

  bool done = false;
  std::error_code connect_ec;
  asio::async_connect(socket_, endpoints,
    [&](std::error_code ec, const asio::ip::tcp::endpoint&){
      connect_ec = ec;
      done = true;
    });
  io_.restart();
  io_.run_for(timeout_);
  if(!done) {
    abandon_pending();
    error = "timed out connecting to " + host_ + " after " + format_duration(timeout_);
    return false;
  }
  if(connect_ec) {
    close();
    error = "unable to connect to " + host_ + ": " + connect_ec.message();
    return false;
  }
  connected_ = true;
  logger_->debug("connected to storage service at {}", host_);

  nlohmann::json reply;
  if(!exchange(make_hello("volctl", service), reply, error)) {
    return false;
  }
  if(reply.value("type", "") == "error") {
    error = reply.value("message", std::string("handshake rejected"));
    close();
    return false;
  }
  if(reply.value("type", "") != "hello" || reply.value("version", "") != kProtocolVersion) {
    error = "unexpected handshake from " + host_ + ": " + reply.dump();
    close();
    return false;
  }
  service_ = reply.value("service", service);
  logger_->info("using storage service '{}' at {}", service_, host_);
  return true;
}

std::optional<nlohmann::json> StorageClient::request(const std::string& op,
                                                     const nlohmann::json& args,
                                                     bool async,
                                                     std::string& error) {
  if(!connected_) {
    error = "not connected to a storage service";
    return std::nullopt;
  }
  nlohmann::json reply;
  if(!exchange(make_request(op, args, async), reply, error)) {
    return std::nullopt;
  }
  const auto type = reply.value("type", "");
  if(type == "error") {
    error = reply.value("message", std::string("request failed"));
    return std::nullopt;
  }
  if(type != "result" && type != "accepted") {
    error = "unexpected reply to " + op + ": " + reply.dump();
    return std::nullopt;
  }
  return reply;
}

bool StorageClient::exchange(const nlohmann::json& message, nlohmann::json& reply, std::string& error) {
  const std::string payload = message.dump() + "\n";
  bool done = false;
  std::error_code failure;

  asio::async_write(socket_, asio::buffer(payload),
    [&](std::error_code ec, std::size_t){
      if(ec) {
        failure = ec;
        done = true;
        return;
      }
      asio::async_read_until(socket_, read_buf_, "\n",
        [&](std::error_code read_ec, std::size_t){
          failure = read_ec;
          done = true;
        });
    });

  io_.restart();
  io_.run_for(timeout_);
  if(!done) {
    abandon_pending();
    error = "timed out waiting for " + host_ + " after " + format_duration(timeout_);
    return false;
  }
  if(failure) {
    close();
    error = "connection to " + host_ + " failed: " + failure.message();
    return false;
  }

  std::istream is(&read_buf_);
  std::string line;
  std::getline(is, line);
  reply = nlohmann::json::parse(line, nullptr, false);
  if(reply.is_discarded() || !reply.is_object()) {
    error = "malformed reply from " + host_;
    return false;
  }
  logger_->trace("reply from {}: {}", host_, line);
  return true;
}
