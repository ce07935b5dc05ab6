/**
 * war-server - Entry Point
 *
 * Loads config, starts the game server on the configured address and runs
 * the ASIO io_context on the configured number of worker threads until
 * SIGINT / SIGTERM.
 */

#include <csignal>
#include <exception>
#include <string>
#include <thread>
#include <vector>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include "config/server_config.h"
#include "game/deck.h"
#include "network/game_server.h"

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::info("war-server starting…");

    std::string config_path = (argc > 1) ? argv[1] : "config.json";
    ServerConfig config;
    try {
        config = load_server_config(config_path);
    } catch (const ConfigError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    spdlog::set_level(config.log_level);
    spdlog::info("Loaded config from {}", config_path);

    asio::io_context io;
    SharedRandomSource rng;

    try {
        GameServer server(io, config, rng);
        server.set_on_session_complete([](uint64_t id, const SessionOutcome& outcome) {
            spdlog::info("Session {} {} ({} rounds)", id, to_string(outcome.state),
                         outcome.rounds_played);
        });
        server.start();

        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const asio::error_code& ec, int signal_number) {
            if (ec) {
                return;
            }
            spdlog::info("Received signal {}, shutting down", signal_number);
            server.stop();
            io.stop();
        });

        // ── Workers ─────────────────────────────────────────────────────────
        std::vector<std::thread> workers;
        for (std::size_t i = 1; i < config.worker_threads; ++i) {
            workers.emplace_back([&io] { io.run(); });
        }
        io.run();
        for (auto& worker : workers) {
            worker.join();
        }
    } catch (const std::exception& e) {
        spdlog::critical("war-server failed: {}", e.what());
        return 1;
    }

    spdlog::info("war-server stopped");
    return 0;
}
