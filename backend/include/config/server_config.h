#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

/**
 * Settings for war-server, read from a JSON file:
 *
 *   {
 *     "server":  { "host": "0.0.0.0", "port": 7878,
 *                  "step_timeout_ms": 30000, "worker_threads": 1,
 *                  "accept_retry_ms": 200 },
 *     "logging": { "level": "info" }
 *   }
 *
 * Every key is optional.
 */
struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 7878;                       // 0 lets the OS pick
    std::chrono::milliseconds step_timeout{30000};
    std::size_t worker_threads = 1;
    std::chrono::milliseconds accept_retry_delay{200};  // pause after a failed accept
    spdlog::level::level_enum log_level = spdlog::level::info;
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/// "trace" .. "off". Throws ConfigError for any other name.
spdlog::level::level_enum parse_log_level(const std::string& name);

/// Throws ConfigError on out-of-range or mistyped values.
ServerConfig parse_server_config(const nlohmann::json& config);

/// Throws ConfigError if the file cannot be opened or parsed.
ServerConfig load_server_config(const std::string& path);
