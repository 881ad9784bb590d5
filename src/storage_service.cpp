#include "storage_service.hpp"

#include <algorithm>
#include <csignal>
#include <deque>
#include <istream>

#include <fmt/format.h>

#include "protocol.hpp"

class LocalStorageService::Session : public std::enable_shared_from_this<Session> {
public:
  Session(LocalStorageService& service, tcp::socket socket)
    : service_(service), socket_(std::move(socket)) {}

  void start() { do_read(); }

  void close() {
    std::error_code ec;
    socket_.close(ec);
  }

private:
  void do_read() {
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, "\n",
      [this, self](std::error_code ec, std::size_t){
        if(ec) {
          if(ec != asio::error::eof && ec != asio::error::operation_aborted) {
            service_.logger_->debug("session read error: {}", ec.message());
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
        do_read();
      });
  }

  void handle_line(const std::string& line) {
    nlohmann::json reply;
    try {
      reply = service_.handle_message(nlohmann::json::parse(line));
    } catch(const nlohmann::json::exception& e) {
      reply = make_error("", std::string("malformed request: ") + e.what());
    }
    send(reply);
  }

  void send(const nlohmann::json& message) {
    const bool start_write = write_queue_.empty();
    write_queue_.push_back(message.dump() + "\n");
    if(start_write) do_write();
  }

  void do_write() {
    if(write_queue_.empty()) return;
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(write_queue_.front()),
      [this, self](std::error_code ec, std::size_t){
        if(ec) {
          service_.logger_->debug("session write error: {}", ec.message());
          close();
          return;
        }
        write_queue_.pop_front();
        do_write();
      });
  }

  LocalStorageService& service_;
  tcp::socket socket_;
  asio::streambuf read_buf_;
  std::deque<std::string> write_queue_;
};

LocalStorageService::LocalStorageService(Options options,
                                         std::shared_ptr<ErrorStream> errors,
                                         std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    errors_(errors ? std::move(errors) : std::make_shared<ErrorStream>()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("storage-service")) {
  if(options_.service_name.empty()) {
    options_.service_name = "default";
  }
}

LocalStorageService::~LocalStorageService() {
  stop();
}

bool LocalStorageService::start(std::string& error) {
  if(started_) return true;

  std::string host;
  unsigned short port = 0;
  if(!parse_service_address(options_.listen_address, host, port, error)) {
    return false;
  }

  try {
    auto listen_address = asio::ip::make_address(host);
    acceptor_ = std::make_unique<tcp::acceptor>(io_);
    tcp::endpoint endpoint(listen_address, port);
    acceptor_->open(endpoint.protocol());
    acceptor_->set_option(tcp::acceptor::reuse_address(true));
    acceptor_->bind(endpoint);
    acceptor_->listen();
    port_ = acceptor_->local_endpoint().port();
  } catch(const std::exception& e) {
    acceptor_.reset();
    error = "unable to listen on " + options_.listen_address + ": " + e.what();
    return false;
  }

  listen_host_ = host;
  started_ = true;
  do_accept();
  logger_->info("storage service '{}' listening on {}", options_.service_name, address());
  return true;
}

void LocalStorageService::start_background() {
  if(!started_ || io_thread_.joinable()) return;
  io_thread_ = std::thread([this](){
    io_.run();
  });
}

void LocalStorageService::run() {
  if(!started_) return;
  io_.run();
}

void LocalStorageService::stop_on_signals() {
  signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
  signals_->async_wait([this](const std::error_code& ec, int signal_number){
    if(ec) return;
    logger_->info("received signal {}, stopping storage service", signal_number);
    shutdown();
  });
}

std::string LocalStorageService::address() const {
  return "tcp://" + listen_host_ + ":" + std::to_string(port_);
}

void LocalStorageService::do_accept() {
  acceptor_->async_accept(
    [this](std::error_code ec, tcp::socket socket){
      if(ec) {
        if(ec == asio::error::operation_aborted) return;
        logger_->error("accept failed: {}", ec.message());
        errors_->push("accept failed: " + ec.message());
      } else {
        sessions_.erase(std::remove_if(sessions_.begin(), sessions_.end(),
                                       [](const std::weak_ptr<Session>& weak){ return weak.expired(); }),
                        sessions_.end());
        auto session = std::make_shared<Session>(*this, std::move(socket));
        sessions_.push_back(session);
        tracked_sessions_.store(sessions_.size(), std::memory_order_relaxed);
        session->start();
      }
      if(acceptor_ && acceptor_->is_open()) {
        do_accept();
      }
    });
}

// Runs on the io thread. Once the acceptor, the signal wait and every session
// are closed the io_context runs out of work and its run() returns.
void LocalStorageService::shutdown() {
  if(acceptor_) {
    std::error_code ec;
    acceptor_->close(ec);
  }
  if(signals_) {
    std::error_code ec;
    signals_->cancel(ec);
  }
  for(auto& weak : sessions_) {
    if(auto session = weak.lock()) session->close();
  }
  sessions_.clear();
  tracked_sessions_.store(0, std::memory_order_relaxed);
}

void LocalStorageService::stop() {
  if(!started_) {
    errors_->close();
    return;
  }
  started_ = false;
  asio::post(io_, [this](){ shutdown(); });
  if(io_thread_.joinable()) {
    io_thread_.join();
  } else {
    io_.run();
  }
  io_.restart();
  acceptor_.reset();
  signals_.reset();
  errors_->close();
  logger_->debug("storage service '{}' stopped", options_.service_name);
}

nlohmann::json LocalStorageService::handle_message(const nlohmann::json& message) {
  const auto type = message.value("type", "");
  if(type == "hello") {
    return make_hello_reply(options_.service_name);
  }
  if(type == "request") {
    const auto op = message.value("op", "");
    if(op.empty()) return make_error(op, "request without op");
    const auto args = message.contains("args") ? message.at("args") : nlohmann::json::object();
    return handle_request(op, args, message.value("async", false));
  }
  return make_error("", "unsupported message type '" + type + "'");
}

nlohmann::json LocalStorageService::handle_request(const std::string& op,
                                                   const nlohmann::json& args,
                                                   bool async) {
  logger_->debug("service '{}' handling {} {}", options_.service_name, op, args.dump());

  if(op == "module.types") {
    return make_result(op, nlohmann::json::array({
      {{"name", "storage"}, {"description", "Embedded storage service"}}
    }));
  }
  if(op == "module.instances.list") {
    return make_result(op, nlohmann::json::array({
      {{"name", options_.service_name}, {"type", "storage"}, {"address", address()}, {"started", true}}
    }));
  }
  if(op == "volume.path") {
    return make_error(op, "volume not found: " + args.value("volumeID", std::string()));
  }
  if(is_read_operation(op)) {
    return make_result(op, nlohmann::json::array());
  }

  // Mutations need a storage driver; none ship with the embedded service.
  const auto failure = fmt::format("service '{}' has no storage driver to perform {}",
                                   options_.service_name, op);
  if(async) {
    asio::post(io_, [this, failure](){
      logger_->warn("{}", failure);
      errors_->push(failure);
    });
    return make_accepted(op);
  }
  return make_error(op, failure);
}
