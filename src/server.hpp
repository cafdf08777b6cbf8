#pragma once
#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "connection.hpp"
#include "log.hpp"

// Accept loop shared by the tracker and the peer's inbound listener. Each
// accepted socket gets its own strand, so connections on a multi-threaded
// io_context are serviced in parallel.
class Server {
public:
    // Binds immediately; a bind failure throws asio::system_error.
    Server(asio::io_context& io,
           const std::string& listen_ip,
           uint16_t port,
           Connection::LineHandler handler,
           std::chrono::milliseconds io_timeout,
           std::shared_ptr<Logger> logger,
           Connection::Framing framing = Connection::Framing::Line);

    void start_accept();
    // Call once the io_context is no longer running.
    void close();

    uint16_t port() const { return port_; }

private:
    void do_accept();

    asio::io_context& io_;
    asio::ip::tcp::acceptor acceptor_;
    Connection::LineHandler handler_;
    std::chrono::milliseconds io_timeout_;
    std::shared_ptr<Logger> logger_;
    Connection::Framing framing_;
    uint16_t port_ = 0;
    std::atomic<bool> accepting_{false};
};
