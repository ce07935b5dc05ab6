#pragma once

#include <asio.hpp>
#include <string>

/// "address:port", for log lines.
inline std::string endpoint_to_string(const asio::ip::tcp::endpoint& endpoint) {
    return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}
