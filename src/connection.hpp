#pragma once
#include <asio.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "log.hpp"

// One accepted socket serving a single request: read one line (or whatever
// arrives before the peer half-closes), hand it to the handler, write the
// optional reply, close. A deadline covers the whole exchange.
//
// With Framing::LineOrChunk the first chunk received is the request even
// without a newline; tracker clients send a bare command and wait for the
// reply on the same connection.
class Connection : public std::enable_shared_from_this<Connection> {
public:
    using LineHandler = std::function<std::optional<std::string>(const std::string& line,
                                                                 const std::string& remote)>;

    enum class Framing { Line, LineOrChunk };

    static constexpr std::size_t kMaxLineBytes = 64 * 1024;
    static constexpr std::size_t kChunkBytes = 4096;

    static std::shared_ptr<Connection> create(asio::ip::tcp::socket sock,
                                              LineHandler handler,
                                              std::chrono::milliseconds timeout,
                                              std::shared_ptr<Logger> logger,
                                              Framing framing = Framing::Line);

    ~Connection();

    void start();
    const std::string& remote() const { return remote_; }

private:
    Connection(asio::ip::tcp::socket sock,
               LineHandler handler,
               std::chrono::milliseconds timeout,
               std::shared_ptr<Logger> logger,
               Framing framing);

    void do_read();
    void do_read_chunk();
    void take_line();
    void handle_line(std::string line);
    void do_write();
    void close();

    asio::ip::tcp::socket socket_;
    asio::steady_timer deadline_;
    asio::streambuf read_buf_;
    LineHandler handler_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<Logger> logger_;
    Framing framing_;
    std::string remote_;
    std::string reply_;
    bool closed_ = false;
};
