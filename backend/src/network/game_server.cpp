/**
 * GameServer - Listens for incoming TCP connections and pairs them into games.
 *
 * Uses standalone ASIO for async I/O. The first connection waits for an
 * opponent; the second one completes the pair and a GameSession takes over
 * both sockets. A waiting connection whose peer hangs up is dropped instead
 * of being paired.
 */

#include "network/game_server.h"

#include <memory>

#include <poll.h>
#include <spdlog/spdlog.h>

#include "network/endpoint.h"

namespace {

/// True once the remote end has closed or reset the connection. Pending
/// inbound bytes are left in place for the session to read.
bool peer_hung_up(asio::ip::tcp::socket& socket) {
#if defined(POLLRDHUP)
    // Also sees a FIN queued behind bytes the peer sent before leaving.
    pollfd pfd{socket.native_handle(), POLLRDHUP, 0};
    if (::poll(&pfd, 1, 0) > 0 && (pfd.revents & (POLLRDHUP | POLLHUP | POLLERR)) != 0) {
        return true;
    }
#endif
    asio::error_code ec;
    socket.non_blocking(true, ec);
    if (ec) {
        return true;
    }
    uint8_t byte = 0;
    socket.receive(asio::buffer(&byte, 1), asio::socket_base::message_peek, ec);

    asio::error_code restore_ec;
    socket.non_blocking(false, restore_ec);
    if (restore_ec) {
        return true;
    }
    if (ec == asio::error::would_block || ec == asio::error::try_again) {
        return false;
    }
    return static_cast<bool>(ec);
}

}  // namespace

GameServer::GameServer(asio::io_context& io, const ServerConfig& config, RandomSource& rng)
    : io_(io),
      acceptor_(asio::make_strand(io),
                asio::ip::tcp::endpoint(asio::ip::make_address(config.host), config.port)),
      rng_(rng),
      step_timeout_(config.step_timeout),
      accept_retry_delay_(config.accept_retry_delay),
      accept_retry_(acceptor_.get_executor()) {}

void GameServer::start() {
    spdlog::info("Listening on {}", endpoint_to_string(acceptor_.local_endpoint()));
    asio::dispatch(acceptor_.get_executor(), [this] { do_accept(); });
}

void GameServer::stop() {
    asio::post(acceptor_.get_executor(), [this] {
        asio::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            spdlog::warn("Closing acceptor: {}", ec.message());
        }
        accept_retry_.cancel();
        if (waiting_) {
            drop_waiting("server stopping");
        }
    });
}

void GameServer::set_on_session_complete(SessionCallback cb) {
    on_session_complete_ = std::move(cb);
}

asio::ip::tcp::endpoint GameServer::local_endpoint() const {
    return acceptor_.local_endpoint();
}

void GameServer::do_accept() {
    // Accepted sockets live on the plain io_context executor so that every
    // session gets a strand of its own.
    acceptor_.async_accept(io_, [this](const asio::error_code& ec, asio::ip::tcp::socket socket) {
        if (!acceptor_.is_open()) {
            return;
        }
        if (ec) {
            // Errors such as EMFILE persist; retrying at once would spin.
            ++accept_failures_;
            spdlog::error("Accept failed: {}, retrying in {} ms", ec.message(),
                          accept_retry_delay_.count());
            retry_accept_later();
            return;
        }
        on_connection(std::move(socket));
        do_accept();
    });
}

void GameServer::retry_accept_later() {
    accept_retry_.expires_after(accept_retry_delay_);
    accept_retry_.async_wait([this](const asio::error_code& ec) {
        if (ec || !acceptor_.is_open()) {
            return;
        }
        do_accept();
    });
}

void GameServer::on_connection(asio::ip::tcp::socket socket) {
    asio::error_code ec;
    const auto remote = socket.remote_endpoint(ec);
    const std::string peer = ec ? std::string("unknown peer") : endpoint_to_string(remote);

    if (waiting_ && peer_hung_up(*waiting_)) {
        drop_waiting("left before an opponent arrived");
    }

    if (!waiting_) {
        spdlog::info("{} connected, waiting for an opponent", peer);
        waiting_.emplace(std::move(socket));
        ++waiting_generation_;
        watch_waiting();
        return;
    }

    const uint64_t id = next_session_id_++;
    spdlog::info("{} connected, pairing into session {}", peer, id);

    waiting_->cancel(ec);
    if (ec) {
        spdlog::debug("Cancelling watch on waiting peer: {}", ec.message());
    }
    auto session = std::make_shared<GameSession>(id, std::move(*waiting_), std::move(socket),
                                                 rng_, step_timeout_);
    waiting_.reset();
    ++active_sessions_;
    session->start([this, id](const SessionOutcome& outcome) {
        --active_sessions_;
        if (on_session_complete_) {
            on_session_complete_(id, outcome);
        }
    });
}

void GameServer::watch_waiting() {
    waiting_->async_wait(
        asio::ip::tcp::socket::wait_read,
        asio::bind_executor(acceptor_.get_executor(),
                            [this, generation = waiting_generation_](const asio::error_code& ec) {
                                if (ec == asio::error::operation_aborted || !waiting_ ||
                                    generation != waiting_generation_) {
                                    return;
                                }
                                // Readable without a hang-up means the peer has
                                // already sent its opt-in; it stays queued.
                                if (ec || peer_hung_up(*waiting_)) {
                                    drop_waiting("left before an opponent arrived");
                                }
                            }));
}

void GameServer::drop_waiting(const char* why) {
    asio::error_code ec;
    const auto remote = waiting_->remote_endpoint(ec);
    spdlog::info("Dropping waiting connection {}: {}",
                 ec ? std::string("unknown peer") : endpoint_to_string(remote), why);
    waiting_->close(ec);
    waiting_.reset();
    ++waiting_generation_;
}
