#include "protocol.hpp"

#include <array>
#include <stdexcept>

json make_hello(const std::string& client_name, const std::string& service) {
    json j;
    j["type"] = "hello";
    j["version"] = kProtocolVersion;
    j["client"] = client_name;
    j["service"] = service;
    return j;
}

json make_hello_reply(const std::string& service) {
    json j;
    j["type"] = "hello";
    j["version"] = kProtocolVersion;
    j["service"] = service;
    return j;
}

json make_request(const std::string& op, const json& args, bool async) {
    json j;
    j["type"] = "request";
    j["op"] = op;
    j["args"] = args.is_null() ? json::object() : args;
    j["async"] = async;
    return j;
}

json make_result(const std::string& op, const json& result) {
    json j;
    j["type"] = "result";
    j["op"] = op;
    j["result"] = result;
    return j;
}

json make_accepted(const std::string& op) {
    json j;
    j["type"] = "accepted";
    j["op"] = op;
    return j;
}

json make_error(const std::string& op, const std::string& message) {
    json j;
    j["type"] = "error";
    j["op"] = op;
    j["message"] = message;
    return j;
}

bool is_read_operation(const std::string& op) {
    static const std::array<const char*, 8> reads = {
        "module.types",
        "module.instances.list",
        "adapter.types",
        "adapter.instances",
        "volume.list",
        "volume.path",
        "snapshot.list",
        "device.list",
    };
    for(const auto* read : reads) {
        if(op == read) return true;
    }
    return false;
}

bool parse_service_address(const std::string& text,
                           std::string& host,
                           unsigned short& port,
                           std::string& error) {
    std::string rest = text;
    const auto scheme_end = rest.find("://");
    if(scheme_end != std::string::npos) {
        const auto scheme = rest.substr(0, scheme_end);
        if(scheme != "tcp") {
            error = "unsupported protocol '" + scheme + "' in address '" + text + "'";
            return false;
        }
        rest = rest.substr(scheme_end + 3);
    }
    const auto colon = rest.rfind(':');
    if(colon == std::string::npos || colon == 0 || colon + 1 == rest.size()) {
        error = "address must be host:port (got '" + text + "')";
        return false;
    }
    host = rest.substr(0, colon);
    try {
        std::size_t consumed = 0;
        const int value = std::stoi(rest.substr(colon + 1), &consumed);
        if(consumed != rest.size() - colon - 1 || value < 0 || value > 65535) {
            throw std::out_of_range("port");
        }
        port = static_cast<unsigned short>(value);
    } catch(const std::exception&) {
        error = "invalid port in address '" + text + "'";
        return false;
    }
    return true;
}
