#include "inbound_listener.hpp"
#include "server.hpp"

InboundListener::InboundListener(asio::io_context& io,
                                 const std::string& listen_ip,
                                 uint16_t port,
                                 MessageSink sink,
                                 std::chrono::milliseconds io_timeout,
                                 std::shared_ptr<Logger> logger)
: sink_(std::move(sink)),
  logger_(std::move(logger))
{
    server_ = std::make_unique<Server>(io, listen_ip, port,
        [this](const std::string& line, const std::string& remote){
            return on_line(line, remote);
        },
        io_timeout, logger_);
}

InboundListener::~InboundListener() = default;

void InboundListener::start(){
    server_->start_accept();
    logger_->info("Listening for peers on port {}", server_->port());
}

void InboundListener::close(){
    server_->close();
}

uint16_t InboundListener::port() const {
    return server_->port();
}

std::optional<std::string> InboundListener::on_line(const std::string& line, const std::string& remote){
    auto message = parse_chat_message(line);
    if(!message){
        logger_->warn("Dropped undecodable message from {}", remote);
        return std::nullopt;
    }
    if(sink_) sink_(*message, remote);
    return std::nullopt;
}
