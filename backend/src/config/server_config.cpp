/**
 * ServerConfig - JSON configuration for war-server.
 */

#include "config/server_config.h"

#include <fstream>
#include <utility>

using json = nlohmann::json;

spdlog::level::level_enum parse_log_level(const std::string& name) {
    static const std::pair<const char*, spdlog::level::level_enum> kLevels[] = {
        {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},   {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},   {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    };
    for (const auto& [known, level] : kLevels) {
        if (name == known) {
            return level;
        }
    }
    throw ConfigError("unknown log level '" + name + "'");
}

ServerConfig parse_server_config(const json& config) {
    ServerConfig result;
    try {
        const json server = config.value("server", json::object());
        result.host = server.value("host", result.host);

        const auto port = server.value("port", static_cast<int64_t>(result.port));
        if (port < 0 || port > 65535) {
            throw ConfigError("server.port: " + std::to_string(port) + " is not a valid port");
        }
        result.port = static_cast<uint16_t>(port);

        const auto timeout_ms = server.value("step_timeout_ms",
                                             static_cast<int64_t>(result.step_timeout.count()));
        if (timeout_ms <= 0) {
            throw ConfigError("server.step_timeout_ms must be positive");
        }
        result.step_timeout = std::chrono::milliseconds(timeout_ms);

        const auto threads = server.value("worker_threads",
                                          static_cast<int64_t>(result.worker_threads));
        if (threads <= 0) {
            throw ConfigError("server.worker_threads must be at least 1");
        }
        result.worker_threads = static_cast<std::size_t>(threads);

        const auto retry_ms = server.value("accept_retry_ms",
                                           static_cast<int64_t>(result.accept_retry_delay.count()));
        if (retry_ms <= 0) {
            throw ConfigError("server.accept_retry_ms must be positive");
        }
        result.accept_retry_delay = std::chrono::milliseconds(retry_ms);

        const json logging = config.value("logging", json::object());
        try {
            result.log_level = parse_log_level(logging.value("level", std::string("info")));
        } catch (const ConfigError& e) {
            throw ConfigError(std::string("logging.level: ") + e.what());
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
    return result;
}

ServerConfig load_server_config(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }
    json config;
    try {
        config = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError("Cannot parse config file " + path + ": " + e.what());
    }
    return parse_server_config(config);
}
