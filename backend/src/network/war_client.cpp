/**
 * WarClient - Connects to a war-server and plays one game.
 *
 * Blocking socket I/O; each frame is read as a tag byte followed by the
 * payload length that tag implies.
 */

#include "network/war_client.h"

#include <array>

#include <spdlog/spdlog.h>

WarClient::WarClient(asio::io_context& io)
    : socket_(io) {}

bool WarClient::connect(const std::string& host, uint16_t port) {
    asio::error_code ec;
    asio::ip::tcp::resolver resolver(socket_.get_executor());
    auto endpoints = resolver.resolve(host, std::to_string(port), ec);
    if (ec) {
        spdlog::error("Cannot resolve {}: {}", host, ec.message());
        return false;
    }
    asio::connect(socket_, endpoints, ec);
    if (ec) {
        spdlog::error("Cannot connect to {}:{}: {}", host, port, ec.message());
        return false;
    }
    return true;
}

bool WarClient::send(const Message& message) {
    return send_raw(encode_message(message));
}

bool WarClient::send_raw(const std::vector<uint8_t>& bytes) {
    asio::error_code ec;
    asio::write(socket_, asio::buffer(bytes), ec);
    if (ec) {
        spdlog::debug("Send failed: {}", ec.message());
        return false;
    }
    return true;
}

std::optional<Message> WarClient::receive() {
    std::array<uint8_t, kMaxMessageSize> frame{};
    asio::error_code ec;
    asio::read(socket_, asio::buffer(frame.data(), 1), ec);
    if (ec) {
        spdlog::debug("Connection closed: {}", ec.message());
        return std::nullopt;
    }
    const std::size_t size = payload_size(frame[0]);
    asio::read(socket_, asio::buffer(frame.data() + 1, size), ec);
    if (ec) {
        spdlog::debug("Connection closed mid-frame: {}", ec.message());
        return std::nullopt;
    }
    return decode_message(frame[0], frame.data() + 1, size);
}

GameTally WarClient::play_full_game() {
    GameTally tally;
    if (!send(WantGame{})) {
        return tally;
    }

    try {
        auto start = receive();
        if (!start || !std::holds_alternative<GameStart>(*start)) {
            spdlog::warn("Server did not start a game");
            return tally;
        }
        const Hand hand = std::get<GameStart>(*start).hand;
        spdlog::info("Dealt {} cards, first up: {}", hand.size(), hand.front().name());

        for (const Card& card : hand) {
            if (!send(PlayCard{card})) {
                spdlog::warn("Lost connection after {} rounds", tally.rounds);
                return tally;
            }
            auto reply = receive();
            if (!reply || !std::holds_alternative<PlayResult>(*reply)) {
                spdlog::warn("No result for round {}", tally.rounds + 1);
                return tally;
            }
            const RoundResult result = std::get<PlayResult>(*reply).result;
            switch (result) {
                case RoundResult::Win:  ++tally.wins;   break;
                case RoundResult::Draw: ++tally.draws;  break;
                case RoundResult::Lose: ++tally.losses; break;
            }
            ++tally.rounds;
            spdlog::debug("Round {}: played {}, {}", tally.rounds, card.name(), to_string(result));
        }
    } catch (const DecodeFailure& e) {
        spdlog::error("Server sent an invalid frame: {}", e.what());
        return tally;
    }

    tally.completed = tally.rounds == kHandSize;
    return tally;
}

void WarClient::disconnect() {
    asio::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    if (ec) {
        spdlog::debug("Disconnect: {}", ec.message());
    }
}
