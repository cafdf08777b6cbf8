#include "transport.hpp"
#include "errors.hpp"

#include <asio.hpp>

namespace {

constexpr std::size_t kMaxReplyBytes = 4 * 1024 * 1024;

std::string exchange(const std::string& host,
                     uint16_t port,
                     const std::string& line,
                     std::chrono::milliseconds timeout,
                     bool read_reply) {
    using tcp = asio::ip::tcp;
    asio::io_context io;
    tcp::resolver resolver(io);
    tcp::socket socket(io);

    const std::string target = host + ":" + std::to_string(port);
    const std::string payload = line + "\n";
    std::string reply;
    std::string stage = "resolve";
    std::error_code failure;
    bool finished = false;

    auto on_connected = [&](std::error_code ec){
        if(ec){ failure = ec; return; }
        stage = "write";
        asio::async_write(socket, asio::buffer(payload),
            [&](std::error_code ec, std::size_t){
                if(ec){ failure = ec; return; }
                if(!read_reply){
                    std::error_code ignored;
                    socket.shutdown(tcp::socket::shutdown_send, ignored);
                    finished = true;
                    return;
                }
                stage = "read";
                asio::async_read(socket, asio::dynamic_buffer(reply, kMaxReplyBytes),
                    [&](std::error_code ec, std::size_t){
                        if(ec && ec != asio::error::eof){ failure = ec; return; }
                        finished = true;
                    });
            });
    };

    // numeric addresses skip the resolver; a hostname lookup runs getaddrinfo,
    // which cannot be cancelled once started
    std::error_code not_numeric;
    auto address = asio::ip::make_address(host, not_numeric);
    if(!not_numeric){
        stage = "connect";
        socket.async_connect(tcp::endpoint(address, port), on_connected);
    } else {
        resolver.async_resolve(host, std::to_string(port),
            [&](std::error_code ec, tcp::resolver::results_type results){
                if(ec){ failure = ec; return; }
                stage = "connect";
                asio::async_connect(socket, results,
                    [&](std::error_code ec, const tcp::endpoint&){ on_connected(ec); });
            });
    }

    io.run_for(timeout);

    if(!finished && !failure){
        // deadline hit with an operation still pending; cancel and drain so
        // no handler outlives this frame
        resolver.cancel();
        std::error_code ignored;
        socket.close(ignored);
        io.restart();
        io.run();
        throw TransportError(stage + " to " + target + " timed out", true);
    }
    if(failure){
        throw TransportError(stage + " to " + target + " failed: " + failure.message(), false);
    }

    std::error_code ignored;
    socket.close(ignored);
    while(!reply.empty() && (reply.back() == '\n' || reply.back() == '\r')){
        reply.pop_back();
    }
    return reply;
}

} // namespace

std::string request_line(const std::string& host,
                         uint16_t port,
                         const std::string& line,
                         std::chrono::milliseconds timeout) {
    return exchange(host, port, line, timeout, true);
}

void send_line(const std::string& host,
               uint16_t port,
               const std::string& line,
               std::chrono::milliseconds timeout) {
    exchange(host, port, line, timeout, false);
}
