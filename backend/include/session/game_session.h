#pragma once

#include <asio.hpp>
#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "game/card.h"
#include "game/deck.h"
#include "protocol/message.h"

enum class SessionState {
    AwaitingReady,
    Dealing,
    RoundInProgress,
    Resolving,
    Finished,
    Aborted,
};

enum class AbortReason {
    None,
    ProtocolViolation,
    IoFailure,
    Timeout,
    InternalError,
};

const char* to_string(SessionState state);
const char* to_string(AbortReason reason);

/// Terminal result of a session, handed to the completion handler.
struct SessionOutcome {
    SessionState state = SessionState::Aborted;
    AbortReason reason = AbortReason::None;
    std::size_t rounds_played = 0;
    std::string detail;
};

/// A peer sent a well-formed message that is wrong for the current state.
class ProtocolViolation : public std::runtime_error {
public:
    explicit ProtocolViolation(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * One game of War between two connected peers.
 *
 *   AwaitingReady -> Dealing -> (RoundInProgress -> Resolving) x 26 -> Finished
 *
 * Any protocol violation, I/O error or missed deadline moves the session to
 * Aborted. Both sockets are closed in either terminal state.
 *
 * Every step talks to both peers at once under a single deadline; the first
 * failure closes both sockets, which cancels whatever is still outstanding.
 * All handlers run on the session's own strand.
 */
class GameSession : public std::enable_shared_from_this<GameSession> {
public:
    using CompletionHandler = std::function<void(const SessionOutcome&)>;

    GameSession(uint64_t id,
                asio::ip::tcp::socket player_one,
                asio::ip::tcp::socket player_two,
                RandomSource& rng,
                std::chrono::milliseconds step_timeout);

    /// Start the handshake. `on_complete` runs once, on the session strand.
    void start(CompletionHandler on_complete);

    [[nodiscard]] uint64_t id() const { return id_; }

private:
    struct Player {
        Player(asio::ip::tcp::socket s, std::string l);

        asio::ip::tcp::socket socket;
        std::string label;
        std::array<uint8_t, kMaxMessageSize> inbound{};
        std::vector<uint8_t> outbound;
        Hand hand;
        std::size_t next_card = 0;
        std::optional<Card> played;
    };

    void begin_handshake();
    void deal();
    void begin_round();
    void resolve();
    void finish();
    void abort(AbortReason reason, const std::string& detail);

    // One step = a set of concurrent reads or writes sharing a deadline.
    void read_from_both(std::function<void()> then);
    void write_to_both(std::function<void()> then);
    void begin_step(std::size_t operations, std::function<void()> then);
    void operation_done();

    void read_tag(Player& player);
    void read_payload(Player& player, std::size_t size);
    void write(Player& player);

    /// Validates an inbound message against the current state and records
    /// it. Throws ProtocolViolation.
    void accept_message(Player& player, const Message& message);

    void close_sockets();
    void notify(SessionOutcome outcome);
    [[nodiscard]] bool terminal() const;

    uint64_t id_;
    asio::strand<asio::any_io_executor> strand_;
    asio::steady_timer deadline_;
    std::array<Player, 2> players_;
    RandomSource& rng_;
    std::chrono::milliseconds step_timeout_;

    SessionState state_ = SessionState::AwaitingReady;
    std::size_t round_ = 0;
    std::size_t step_ = 0;
    std::size_t pending_ = 0;
    std::function<void()> on_step_done_;
    CompletionHandler on_complete_;
};
