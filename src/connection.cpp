#include "connection.hpp"

#include <istream>

namespace {

std::string describe_remote(const asio::ip::tcp::socket& sock) {
    std::error_code ec;
    auto ep = sock.remote_endpoint(ec);
    if(ec) return "unknown";
    return ep.address().to_string() + ":" + std::to_string(ep.port());
}

} // namespace

std::shared_ptr<Connection> Connection::create(asio::ip::tcp::socket sock,
                                               LineHandler handler,
                                               std::chrono::milliseconds timeout,
                                               std::shared_ptr<Logger> logger,
                                               Framing framing)
{
    return std::shared_ptr<Connection>(
        new Connection(std::move(sock), std::move(handler), timeout, std::move(logger), framing));
}

Connection::Connection(asio::ip::tcp::socket sock,
                       LineHandler handler,
                       std::chrono::milliseconds timeout,
                       std::shared_ptr<Logger> logger,
                       Framing framing)
: socket_(std::move(sock)),
  deadline_(socket_.get_executor()),
  read_buf_(kMaxLineBytes),
  handler_(std::move(handler)),
  timeout_(timeout),
  logger_(std::move(logger)),
  framing_(framing),
  remote_(describe_remote(socket_))
{
}

Connection::~Connection(){
    std::error_code ec;
    socket_.close(ec);
}

void Connection::start(){
    auto self = shared_from_this();
    deadline_.expires_after(timeout_);
    deadline_.async_wait([this, self](const std::error_code& ec){
        if(ec) return; // cancelled: the exchange finished first
        logger_->debug("Connection from {} timed out", remote_);
        close();
    });
    if(framing_ == Framing::LineOrChunk){
        do_read_chunk();
    } else {
        do_read();
    }
}

void Connection::do_read(){
    auto self = shared_from_this();
    asio::async_read_until(socket_, read_buf_, '\n',
        [this, self](std::error_code ec, std::size_t){
            if(ec == asio::error::eof && read_buf_.size() > 0){
                // client half-closed without a newline; take what it sent
            } else if(ec){
                if(ec == asio::error::not_found){
                    logger_->warn("Request from {} exceeds {} bytes", remote_, kMaxLineBytes);
                } else if(ec != asio::error::operation_aborted){
                    logger_->debug("Connection read error from {}: {}", remote_, ec.message());
                }
                close();
                return;
            }
            take_line();
        });
}

void Connection::do_read_chunk(){
    auto self = shared_from_this();
    socket_.async_read_some(read_buf_.prepare(kChunkBytes),
        [this, self](std::error_code ec, std::size_t n){
            if(ec){
                if(ec != asio::error::eof && ec != asio::error::operation_aborted){
                    logger_->debug("Connection read error from {}: {}", remote_, ec.message());
                }
                close();
                return;
            }
            read_buf_.commit(n);
            // anything after a newline in the same chunk is ignored
            take_line();
        });
}

void Connection::take_line(){
    std::istream is(&read_buf_);
    std::string line;
    std::getline(is, line);
    if(!line.empty() && line.back() == '\r') line.pop_back();
    handle_line(std::move(line));
}

void Connection::handle_line(std::string line){
    std::optional<std::string> reply;
    try{
        reply = handler_(line, remote_);
    } catch(const std::exception& ex){
        logger_->error("Handler failed for request from {}: {}", remote_, ex.what());
        close();
        return;
    }
    if(!reply){
        close();
        return;
    }
    reply_ = std::move(*reply);
    do_write();
}

void Connection::do_write(){
    auto self = shared_from_this();
    asio::async_write(socket_, asio::buffer(reply_),
        [this, self](std::error_code ec, std::size_t){
            if(ec && ec != asio::error::operation_aborted){
                logger_->debug("Connection write error to {}: {}", remote_, ec.message());
            }
            close();
        });
}

void Connection::close(){
    if(closed_) return;
    closed_ = true;
    deadline_.cancel();
    std::error_code ec;
    socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}
