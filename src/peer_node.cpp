#include "peer_node.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>
#include <stdexcept>

#include "chat_cli.hpp"
#include "inbound_listener.hpp"
#include "message_history.hpp"
#include "peer_client.hpp"
#include "settings_manager.hpp"
#include "utils.hpp"

PeerNode::PeerNode(std::shared_ptr<SettingsManager> settings, Options options)
  : options_(options),
    settings_(settings ? std::move(settings) : std::make_shared<SettingsManager>(PEER_SETTINGS_SPECIFICATION)),
    logger_(std::make_shared<Logger>("peer")) {}

PeerNode::~PeerNode() {
  stop();
}

void PeerNode::start() {
  if(started_) return;

  peer_id_ = settings_->get<std::string>("peer_id");
  if(peer_id_.empty()) {
    peer_id_ = default_peer_id();
  }
  logger_->set_name(peer_id_);

  const auto listen_ip = settings_->get<std::string>("listen_ip");
  const auto requested_port = settings_->get_port("listen_port", true);
  const auto io_timeout = settings_->get_millis("io_timeout_ms");
  const auto history_limit = settings_->get<int>("history_limit");
  if(history_limit <= 0) {
    throw std::runtime_error("history_limit must be positive");
  }
  audio_notifications_ = settings_->get<bool>("audio_notifications");
  history_ = std::make_shared<MessageHistory>(static_cast<std::size_t>(history_limit));

  try {
    listener_ = std::make_unique<InboundListener>(io_, listen_ip, requested_port,
      [this](const ChatMessage& message, const std::string& remote){
        on_message(message, remote);
      },
      io_timeout, logger_);
  } catch(const std::system_error& e) {
    logger_->error("Unable to listen on {}:{}: {}", listen_ip, requested_port, e.what());
    throw;
  }
  listen_port_ = listener_->port();

  advertise_ip_ = settings_->get<std::string>("advertise_ip");
  if(advertise_ip_.empty()) {
    advertise_ip_ = (listen_ip != "0.0.0.0" && listen_ip != "::") ? listen_ip : detect_local_ip();
  }

  PeerClient::Options client_options;
  client_options.peer_id = peer_id_;
  client_options.advertise_ip = advertise_ip_;
  client_options.port = listen_port_;
  client_options.tracker_host = settings_->get<std::string>("tracker_host");
  client_options.tracker_port = settings_->get_port("tracker_port", false);
  client_options.heartbeat_interval = settings_->get_seconds("heartbeat_interval");
  client_options.io_timeout = io_timeout;
  client_ = std::make_shared<PeerClient>(client_options, logger_);
  cli_ = std::make_unique<ChatCLI>(client_, history_, logger_);

  listener_->start();
  io_thread_ = std::thread([this](){
    io_.run();
  });
  started_ = true;

  logger_->info("Peer {} advertising {}:{}", peer_id_, advertise_ip_, listen_port_);
  if(!client_->register_with_tracker()) {
    logger_->warn("Not registered with tracker {}:{}; use /register to retry",
                  client_options.tracker_host, client_options.tracker_port);
  }
  client_->refresh_peers();
}

void PeerNode::run() {
  if(!started_) start();
  if(cli_) {
    cli_->run_loop();
  }
  stop();
}

void PeerNode::stop() {
  if(!started_) return;
  started_ = false;

  if(client_) {
    client_->stop_heartbeat();
    client_->unregister_from_tracker();
  }

  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  signals_.reset();
  if(listener_) {
    listener_->close();
  }
  logger_->info("Peer {} stopped", peer_id_);
}

void PeerNode::stop_on_signal() {
  signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
  signals_->async_wait([this](const std::error_code& ec, int signo){
    if(ec) return;
    logger_->info("Signal {} received, leaving", signo);
    // the command loop is blocked reading the terminal, so leave from here
    leave_network();
    std::quick_exit(0);
  });
}

void PeerNode::leave_network() {
  if(client_) {
    client_->stop_heartbeat();
    client_->unregister_from_tracker();
  }
  flush_logs();
}

bool PeerNode::execute_command(const std::string& line) {
  if(!cli_) return true;
  return cli_->execute_command(line);
}

void PeerNode::on_message(const ChatMessage& message, const std::string& remote) {
  history_->add(message);
  logger_->debug("Message from {} via {}", message.from, remote);
  if(audio_notifications_ && options_.interactive) {
    std::cout << '\a';
  }
  const char* label = message.type == MessageType::Broadcast ? "Broadcast" : "Direct message";
  logger_->print("[{}] {}: {}", message.from, label, message.content);
  if(options_.interactive) {
    // the command loop is sitting at its prompt
    std::cout << "> ";
    std::cout.flush();
  }
}
