#include "server.hpp"

Server::Server(asio::io_context& io,
               const std::string& listen_ip,
               uint16_t port,
               Connection::LineHandler handler,
               std::chrono::milliseconds io_timeout,
               std::shared_ptr<Logger> logger,
               Connection::Framing framing)
: io_(io),
  acceptor_(io),
  handler_(std::move(handler)),
  io_timeout_(io_timeout),
  logger_(std::move(logger)),
  framing_(framing)
{
    using tcp = asio::ip::tcp;
    tcp::endpoint endpoint(asio::ip::make_address(listen_ip), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    port_ = acceptor_.local_endpoint().port();
}

void Server::start_accept(){
    accepting_ = true;
    do_accept();
}

void Server::close(){
    accepting_ = false;
    std::error_code ec;
    acceptor_.close(ec);
}

void Server::do_accept(){
    acceptor_.async_accept(asio::make_strand(io_),
        [this](std::error_code ec, asio::ip::tcp::socket sock){
            if(!accepting_ || ec == asio::error::operation_aborted) return;
            if(!ec){
                auto conn = Connection::create(std::move(sock), handler_, io_timeout_, logger_, framing_);
                logger_->debug("Accepted connection from {}", conn->remote());
                conn->start();
            } else {
                logger_->error("accept failed: {}", ec.message());
            }
            do_accept();
        });
}
