/**
 * war-client - Bot that joins a war-server game and plays its hand in order.
 *
 * Usage: war-client <host> <port> [log-level]
 */

#include <exception>
#include <string>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "config/server_config.h"
#include "network/war_client.h"

int main(int argc, char* argv[]) {
    if (argc < 3) {
        spdlog::error("Usage: {} <host> <port> [log-level]", argv[0]);
        return 2;
    }
    if (argc > 3) {
        try {
            spdlog::set_level(parse_log_level(argv[3]));
        } catch (const ConfigError& e) {
            spdlog::error("{}", e.what());
            spdlog::error("Usage: {} <host> <port> [trace|debug|info|warn|error|critical|off]",
                          argv[0]);
            return 2;
        }
    }

    const std::string host = argv[1];
    int port = 0;
    try {
        port = std::stoi(argv[2]);
    } catch (const std::exception&) {
        spdlog::error("Invalid port: {}", argv[2]);
        return 2;
    }
    if (port <= 0 || port > 65535) {
        spdlog::error("Invalid port: {}", argv[2]);
        return 2;
    }

    asio::io_context io;
    WarClient client(io);
    if (!client.connect(host, static_cast<uint16_t>(port))) {
        return 1;
    }
    spdlog::info("Connected to {}:{}, waiting for an opponent", host, port);

    const GameTally tally = client.play_full_game();
    client.disconnect();

    spdlog::info("{} rounds: {} won, {} drawn, {} lost", tally.rounds, tally.wins, tally.draws,
                 tally.losses);
    if (!tally.completed) {
        spdlog::warn("Game did not complete");
        return 1;
    }
    return 0;
}
