/**
 * GameSession - drives one game over two peer sockets.
 *
 * Handshake: both peers must send the exact WantGame frame before anything
 * is dealt. Deal: each peer receives its own GameStart. Rounds: each peer
 * sends the card at the front of its hand, both receive their own
 * PlayResult. The session ends after kHandSize rounds or at the first
 * failure, whichever comes first.
 */

#include "session/game_session.h"

#include <spdlog/spdlog.h>

#include "game/round.h"
#include "network/endpoint.h"

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::AwaitingReady:   return "awaiting ready";
        case SessionState::Dealing:         return "dealing";
        case SessionState::RoundInProgress: return "round in progress";
        case SessionState::Resolving:       return "resolving";
        case SessionState::Finished:        return "finished";
        case SessionState::Aborted:         return "aborted";
    }
    return "unknown";
}

const char* to_string(AbortReason reason) {
    switch (reason) {
        case AbortReason::None:              return "none";
        case AbortReason::ProtocolViolation: return "protocol violation";
        case AbortReason::IoFailure:         return "I/O failure";
        case AbortReason::Timeout:           return "timeout";
        case AbortReason::InternalError:     return "internal error";
    }
    return "unknown";
}

GameSession::Player::Player(asio::ip::tcp::socket s, std::string l)
    : socket(std::move(s)), label(std::move(l)) {
    asio::error_code ec;
    auto remote = socket.remote_endpoint(ec);
    if (!ec) {
        label += " (" + endpoint_to_string(remote) + ")";
    }
}

GameSession::GameSession(uint64_t id,
                         asio::ip::tcp::socket player_one,
                         asio::ip::tcp::socket player_two,
                         RandomSource& rng,
                         std::chrono::milliseconds step_timeout)
    : id_(id),
      strand_(asio::make_strand(player_one.get_executor())),
      deadline_(strand_),
      players_{{Player(std::move(player_one), "player one"),
                Player(std::move(player_two), "player two")}},
      rng_(rng),
      step_timeout_(step_timeout) {}

void GameSession::start(CompletionHandler on_complete) {
    on_complete_ = std::move(on_complete);
    asio::dispatch(strand_, [self = shared_from_this()] { self->begin_handshake(); });
}

// ── State transitions ───────────────────────────────────────────────────────

void GameSession::begin_handshake() {
    spdlog::info("[session {}] started: {} vs {}", id_, players_[0].label, players_[1].label);
    state_ = SessionState::AwaitingReady;
    read_from_both([this] { deal(); });
}

void GameSession::deal() {
    state_ = SessionState::Dealing;
    try {
        auto hands = Deck::fresh_shuffled(rng_).deal_two();
        players_[0].hand = std::move(hands.first);
        players_[1].hand = std::move(hands.second);
        for (auto& player : players_) {
            player.outbound = encode_message(GameStart{player.hand});
        }
    } catch (const std::exception& e) {
        abort(AbortReason::InternalError, std::string("dealing failed: ") + e.what());
        return;
    }
    spdlog::debug("[session {}] hands dealt", id_);
    write_to_both([this] { begin_round(); });
}

void GameSession::begin_round() {
    if (round_ == kHandSize) {
        finish();
        return;
    }
    state_ = SessionState::RoundInProgress;
    read_from_both([this] { resolve(); });
}

void GameSession::resolve() {
    state_ = SessionState::Resolving;
    const Card one = *players_[0].played;
    const Card two = *players_[1].played;
    const RoundOutcome outcome = resolve_round(one, two);

    spdlog::debug("[session {}] round {}: {} vs {} -> {} / {}", id_, round_ + 1,
                  one.name(), two.name(),
                  to_string(outcome.player_one), to_string(outcome.player_two));

    players_[0].outbound = encode_message(PlayResult{outcome.player_one});
    players_[1].outbound = encode_message(PlayResult{outcome.player_two});
    write_to_both([this] {
        ++round_;
        begin_round();
    });
}

void GameSession::finish() {
    state_ = SessionState::Finished;
    deadline_.cancel();
    close_sockets();
    spdlog::info("[session {}] finished after {} rounds", id_, round_);
    notify({SessionState::Finished, AbortReason::None, round_, "all rounds played"});
}

void GameSession::abort(AbortReason reason, const std::string& detail) {
    if (terminal()) {
        return;
    }
    const SessionState failed_in = state_;
    state_ = SessionState::Aborted;
    deadline_.cancel();
    close_sockets();
    spdlog::warn("[session {}] aborted while {} (round {}): {}: {}", id_,
                 to_string(failed_in), round_ + 1, to_string(reason), detail);
    notify({SessionState::Aborted, reason, round_, detail});
}

// ── Steps ───────────────────────────────────────────────────────────────────

void GameSession::read_from_both(std::function<void()> then) {
    begin_step(players_.size(), std::move(then));
    for (auto& player : players_) {
        player.played.reset();
        read_tag(player);
    }
}

void GameSession::write_to_both(std::function<void()> then) {
    begin_step(players_.size(), std::move(then));
    for (auto& player : players_) {
        write(player);
    }
}

void GameSession::begin_step(std::size_t operations, std::function<void()> then) {
    ++step_;
    pending_ = operations;
    on_step_done_ = std::move(then);

    deadline_.expires_after(step_timeout_);
    deadline_.async_wait(asio::bind_executor(
        strand_,
        [this, self = shared_from_this(), step = step_](const asio::error_code& ec) {
            // A stale expiry may already be queued when the step completes.
            if (ec == asio::error::operation_aborted || terminal() ||
                step != step_ || pending_ == 0) {
                return;
            }
            abort(AbortReason::Timeout,
                  "no response within " + std::to_string(step_timeout_.count()) + " ms");
        }));
}

void GameSession::operation_done() {
    if (--pending_ > 0) {
        return;
    }
    deadline_.cancel();
    auto next = std::move(on_step_done_);
    on_step_done_ = nullptr;
    next();
}

void GameSession::read_tag(Player& player) {
    asio::async_read(
        player.socket, asio::buffer(player.inbound.data(), 1),
        asio::bind_executor(
            strand_,
            [this, self = shared_from_this(), &player](const asio::error_code& ec, std::size_t) {
                if (terminal()) {
                    return;
                }
                if (ec) {
                    abort(AbortReason::IoFailure, player.label + " read failed: " + ec.message());
                    return;
                }
                std::size_t size = 0;
                try {
                    size = payload_size(player.inbound[0]);
                } catch (const DecodeFailure& e) {
                    abort(AbortReason::ProtocolViolation, player.label + ": " + e.what());
                    return;
                }
                read_payload(player, size);
            }));
}

void GameSession::read_payload(Player& player, std::size_t size) {
    asio::async_read(
        player.socket, asio::buffer(player.inbound.data() + 1, size),
        asio::bind_executor(
            strand_,
            [this, self = shared_from_this(), &player, size](const asio::error_code& ec,
                                                             std::size_t) {
                if (terminal()) {
                    return;
                }
                if (ec) {
                    abort(AbortReason::IoFailure, player.label + " read failed: " + ec.message());
                    return;
                }
                try {
                    accept_message(player,
                                   decode_message(player.inbound[0], player.inbound.data() + 1, size));
                } catch (const DecodeFailure& e) {
                    abort(AbortReason::ProtocolViolation, player.label + ": " + e.what());
                    return;
                } catch (const ProtocolViolation& e) {
                    abort(AbortReason::ProtocolViolation, e.what());
                    return;
                }
                operation_done();
            }));
}

void GameSession::write(Player& player) {
    asio::async_write(
        player.socket, asio::buffer(player.outbound),
        asio::bind_executor(
            strand_,
            [this, self = shared_from_this(), &player](const asio::error_code& ec, std::size_t) {
                if (terminal()) {
                    return;
                }
                if (ec) {
                    abort(AbortReason::IoFailure, player.label + " write failed: " + ec.message());
                    return;
                }
                operation_done();
            }));
}

void GameSession::accept_message(Player& player, const Message& message) {
    switch (state_) {
        case SessionState::AwaitingReady:
            if (!std::holds_alternative<WantGame>(message)) {
                throw ProtocolViolation(player.label + " sent " + to_string(tag_of(message)) +
                                        " instead of WantGame");
            }
            return;

        case SessionState::RoundInProgress: {
            const auto* play = std::get_if<PlayCard>(&message);
            if (play == nullptr) {
                throw ProtocolViolation(player.label + " sent " + to_string(tag_of(message)) +
                                        " instead of PlayCard");
            }
            const Card& expected = player.hand.at(player.next_card);
            if (!play->card.same_card(expected)) {
                throw ProtocolViolation(player.label + " played the " + play->card.name() +
                                        " but the next card in hand is the " + expected.name());
            }
            player.played = play->card;
            ++player.next_card;
            return;
        }

        default:
            throw ProtocolViolation(player.label + " sent " + to_string(tag_of(message)) +
                                    " while the session was " + to_string(state_));
    }
}

// ── Teardown ────────────────────────────────────────────────────────────────

void GameSession::close_sockets() {
    for (auto& player : players_) {
        asio::error_code ec;
        player.socket.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        if (ec && ec != asio::error::not_connected) {
            spdlog::debug("[session {}] shutdown of {}: {}", id_, player.label, ec.message());
        }
        player.socket.close(ec);
        if (ec) {
            spdlog::debug("[session {}] close of {}: {}", id_, player.label, ec.message());
        }
    }
}

void GameSession::notify(SessionOutcome outcome) {
    if (!on_complete_) {
        return;
    }
    auto handler = std::move(on_complete_);
    on_complete_ = nullptr;
    handler(outcome);
}

bool GameSession::terminal() const {
    return state_ == SessionState::Finished || state_ == SessionState::Aborted;
}
