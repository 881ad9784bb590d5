#pragma once

#include <asio.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "log.hpp"

// Blocking client for the storage service protocol. Every connect and every
// request/response exchange is bounded by the timeout given at construction.
class StorageClient {
public:
  StorageClient(std::string host,
                std::chrono::milliseconds timeout,
                std::shared_ptr<Logger> logger);
  ~StorageClient();

  StorageClient(const StorageClient&) = delete;
  StorageClient& operator=(const StorageClient&) = delete;

  // Connects and performs the hello handshake for `service`.
  bool connect(const std::string& service, std::string& error);
  void close();

  // Returns the service's reply message ("result" or "accepted"). An "error"
  // reply, a timeout or a broken connection yields nullopt and sets error.
  std::optional<nlohmann::json> request(const std::string& op,
                                        const nlohmann::json& args,
                                        bool async,
                                        std::string& error);

  const std::string& host() const { return host_; }
  const std::string& service() const { return service_; }

private:
  bool exchange(const nlohmann::json& message, nlohmann::json& reply, std::string& error);
  void abandon_pending();

  std::string host_;
  std::string service_;
  std::chrono::milliseconds timeout_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  asio::ip::tcp::socket socket_;
  asio::streambuf read_buf_;
  bool connected_ = false;
};
