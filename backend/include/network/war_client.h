#pragma once

#include <asio.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "protocol/message.h"

/// Per-player totals from one game.
struct GameTally {
    std::size_t rounds = 0;
    std::size_t wins   = 0;
    std::size_t draws  = 0;
    std::size_t losses = 0;
    bool completed     = false;
};

/**
 * Blocking TCP client that speaks the War protocol to a server.
 */
class WarClient {
public:
    explicit WarClient(asio::io_context& io);

    bool connect(const std::string& host, uint16_t port);
    bool send(const Message& message);

    /// Write bytes as-is, valid frame or not.
    bool send_raw(const std::vector<uint8_t>& bytes);

    /// Next message, or std::nullopt once the connection is closed or fails.
    /// Throws DecodeFailure if the server sends an invalid frame.
    std::optional<Message> receive();

    /// Handshake, then play the dealt hand front to back.
    GameTally play_full_game();

    void disconnect();

private:
    asio::ip::tcp::socket socket_;
};
