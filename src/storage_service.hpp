#pragma once

#include <asio.hpp>

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "error_stream.hpp"
#include "log.hpp"

// In-process storage service. The CLI starts one on an ephemeral port when no
// storage host is configured; `service start` runs one as the daemon.
// Operations accepted in async mode report their failures on the error stream.
class LocalStorageService {
public:
  struct Options {
    std::string service_name = "default";
    std::string listen_address = "127.0.0.1:0";
  };

  LocalStorageService(Options options,
                      std::shared_ptr<ErrorStream> errors,
                      std::shared_ptr<Logger> logger);
  ~LocalStorageService();

  LocalStorageService(const LocalStorageService&) = delete;
  LocalStorageService& operator=(const LocalStorageService&) = delete;

  bool start(std::string& error);
  void start_background();
  void run();
  void stop_on_signals();
  void stop();

  std::string address() const;
  unsigned short port() const { return port_; }
  const std::string& service_name() const { return options_.service_name; }
  // Sessions held by the accept loop; closed ones are dropped on the next accept.
  std::size_t tracked_sessions() const { return tracked_sessions_.load(std::memory_order_relaxed); }

  nlohmann::json handle_message(const nlohmann::json& message);

private:
  class Session;
  using tcp = asio::ip::tcp;

  void do_accept();
  void shutdown();
  nlohmann::json handle_request(const std::string& op, const nlohmann::json& args, bool async);

  Options options_;
  std::shared_ptr<ErrorStream> errors_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<tcp::acceptor> acceptor_;
  std::unique_ptr<asio::signal_set> signals_;
  std::vector<std::weak_ptr<Session>> sessions_;
  std::atomic<std::size_t> tracked_sessions_{0};
  std::string listen_host_;
  unsigned short port_ = 0;
  bool started_ = false;
};
