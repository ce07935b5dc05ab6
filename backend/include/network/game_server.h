#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>

#include "config/server_config.h"
#include "game/deck.h"
#include "session/game_session.h"

/**
 * Async TCP server that pairs inbound connections two at a time and runs a
 * GameSession for every pair.
 */
class GameServer {
public:
    using SessionCallback = std::function<void(uint64_t session_id,
                                               const SessionOutcome& outcome)>;

    /// Binds to config.host:config.port. Throws asio::system_error if the
    /// address is invalid or the port cannot be bound.
    GameServer(asio::io_context& io, const ServerConfig& config, RandomSource& rng);

    void start();

    /// Stop accepting. Running sessions play on to completion.
    void stop();

    /// Set before start(). Invoked on the finishing session's strand.
    void set_on_session_complete(SessionCallback cb);

    [[nodiscard]] asio::ip::tcp::endpoint local_endpoint() const;
    [[nodiscard]] std::size_t active_sessions() const { return active_sessions_.load(); }
    [[nodiscard]] uint64_t accept_failures() const { return accept_failures_.load(); }

private:
    void do_accept();
    void retry_accept_later();
    void on_connection(asio::ip::tcp::socket socket);

    /// Drops the unpaired connection as soon as its peer hangs up.
    void watch_waiting();
    void drop_waiting(const char* why);

    asio::io_context& io_;
    asio::ip::tcp::acceptor acceptor_;
    RandomSource& rng_;
    std::chrono::milliseconds step_timeout_;
    std::chrono::milliseconds accept_retry_delay_;

    // Only touched from the acceptor's strand.
    asio::steady_timer accept_retry_;
    std::optional<asio::ip::tcp::socket> waiting_;
    uint64_t waiting_generation_ = 0;

    std::atomic<uint64_t> next_session_id_{1};
    std::atomic<std::size_t> active_sessions_{0};
    std::atomic<uint64_t> accept_failures_{0};
    SessionCallback on_session_complete_;
};
