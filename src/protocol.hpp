#pragma once
#include <nlohmann/json.hpp>
#include <string>

using json = nlohmann::json;

// Newline-delimited JSON spoken between StorageClient and LocalStorageService.
inline constexpr const char* kProtocolVersion = "1";

json make_hello(const std::string& client_name, const std::string& service);
json make_hello_reply(const std::string& service);
json make_request(const std::string& op, const json& args, bool async);
json make_result(const std::string& op, const json& result);
json make_accepted(const std::string& op);
json make_error(const std::string& op, const std::string& message);

bool is_read_operation(const std::string& op);

// Accepts "tcp://host:port" or "host:port".
bool parse_service_address(const std::string& text,
                           std::string& host,
                           unsigned short& port,
                           std::string& error);
