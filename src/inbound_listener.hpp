#pragma once
#include <asio.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "log.hpp"
#include "protocol.hpp"

class Server;

// Accepts chat messages from other peers. One message per connection; the
// sink runs on the io thread that serviced the connection.
class InboundListener {
public:
    using MessageSink = std::function<void(const ChatMessage& message, const std::string& remote)>;

    // Binds immediately; throws asio::system_error if the port is taken.
    InboundListener(asio::io_context& io,
                    const std::string& listen_ip,
                    uint16_t port,
                    MessageSink sink,
                    std::chrono::milliseconds io_timeout,
                    std::shared_ptr<Logger> logger);
    ~InboundListener();

    void start();
    void close();
    uint16_t port() const;

private:
    std::optional<std::string> on_line(const std::string& line, const std::string& remote);

    MessageSink sink_;
    std::shared_ptr<Logger> logger_;
    std::unique_ptr<Server> server_;
};
