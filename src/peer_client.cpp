#include "peer_client.hpp"

#include <algorithm>

#include "errors.hpp"
#include "transport.hpp"

PeerClient::PeerClient(Options options, std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>(options_.peer_id)),
    tracker_(options_.tracker_host, options_.tracker_port, options_.io_timeout),
    sender_(&send_line) {}

PeerClient::~PeerClient() {
  stop_heartbeat();
}

bool PeerClient::register_once() {
  try {
    auto reply = tracker_.register_peer(options_.peer_id, options_.advertise_ip, options_.port);
    if(!reply.ok) {
      logger_->error("Registration rejected: {}", reply.message);
      return false;
    }
    logger_->info("Registered with tracker {}:{} as {} ({}:{})",
                  tracker_.host(), tracker_.port(),
                  options_.peer_id, options_.advertise_ip, options_.port);
    return true;
  } catch(const TrackerUnreachable& e) {
    logger_->error("Registration failed: {}", e.what());
    return false;
  }
}

bool PeerClient::register_with_tracker() {
  if(!register_once()) return false;
  start_heartbeat();
  return true;
}

void PeerClient::unregister_from_tracker() {
  try {
    auto reply = tracker_.unregister_peer(options_.peer_id);
    if(reply.ok) {
      logger_->info("Unregistered from tracker");
    } else {
      logger_->warn("Unregister rejected: {}", reply.message);
    }
  } catch(const TrackerUnreachable& e) {
    logger_->warn("Unregister failed: {}", e.what());
  }
}

bool PeerClient::refresh_peers() {
  std::vector<PeerEndpoint> peers;
  try {
    peers = tracker_.get_peers();
  } catch(const TrackerUnreachable& e) {
    logger_->warn("Peer refresh failed: {}", e.what());
    return false;
  }
  std::size_t count = peers.size();
  {
    std::lock_guard lg(cache_mutex_);
    cache_ = std::move(peers);
  }
  logger_->debug("Peer cache refreshed: {} entries", count);
  return true;
}

std::vector<PeerEndpoint> PeerClient::cached_peers() const {
  std::lock_guard lg(cache_mutex_);
  return cache_;
}

std::optional<PeerEndpoint> PeerClient::cached_peer(const std::string& peer_id) const {
  std::lock_guard lg(cache_mutex_);
  auto it = std::find_if(cache_.begin(), cache_.end(),
                         [&](const PeerEndpoint& p){ return p.peer_id == peer_id; });
  if(it == cache_.end()) return std::nullopt;
  return *it;
}

void PeerClient::set_line_sender(LineSender sender) {
  std::lock_guard lg(sender_mutex_);
  sender_ = sender ? std::move(sender) : LineSender(&send_line);
}

DeliveryOutcome PeerClient::deliver(const PeerEndpoint& target, const ChatMessage& message) {
  DeliveryOutcome outcome;
  outcome.peer_id = target.peer_id;

  LineSender sender;
  {
    std::lock_guard lg(sender_mutex_);
    sender = sender_;
  }

  try {
    sender(target.ip, target.port, make_chat_message(message).dump(), options_.io_timeout);
    outcome.status = DeliveryStatus::Delivered;
  } catch(const TransportError& e) {
    outcome.status = DeliveryStatus::DeliveryError;
    outcome.error = e.what();
    logger_->warn("Delivery to {} ({}:{}) failed: {}", target.peer_id, target.ip, target.port, e.what());
  }
  return outcome;
}

DeliveryOutcome PeerClient::send_direct(const std::string& peer_id, const std::string& content) {
  auto target = cached_peer(peer_id);
  if(!target) {
    DeliveryOutcome outcome;
    outcome.peer_id = peer_id;
    outcome.status = DeliveryStatus::UnknownPeer;
    outcome.error = "peer not in cache";
    return outcome;
  }
  return deliver(*target, ChatMessage{MessageType::Direct, options_.peer_id, content});
}

std::vector<DeliveryOutcome> PeerClient::broadcast(const std::string& content) {
  const ChatMessage message{MessageType::Broadcast, options_.peer_id, content};
  std::vector<DeliveryOutcome> outcomes;
  for(const auto& peer : cached_peers()) {
    if(peer.peer_id == options_.peer_id) continue;
    outcomes.push_back(deliver(peer, message));
  }
  auto delivered = std::count_if(outcomes.begin(), outcomes.end(),
                                 [](const DeliveryOutcome& o){ return o.delivered(); });
  logger_->debug("Broadcast reached {} of {} peers", delivered, outcomes.size());
  return outcomes;
}

bool PeerClient::send_heartbeat() {
  try {
    auto reply = tracker_.heartbeat(options_.peer_id);
    if(reply.ok) {
      logger_->debug("Heartbeat acknowledged");
      return true;
    }
    logger_->warn("Heartbeat rejected ({}), registering again", reply.message);
  } catch(const TrackerUnreachable& e) {
    logger_->warn("Heartbeat failed: {}", e.what());
    return false;
  }
  return register_once();
}

void PeerClient::start_heartbeat() {
  std::lock_guard lg(heartbeat_mutex_);
  if(heartbeat_thread_.joinable()) return;
  heartbeat_stop_ = false;
  heartbeat_thread_ = std::thread([this](){ heartbeat_loop(); });
}

void PeerClient::stop_heartbeat() {
  std::thread worker;
  {
    std::lock_guard lg(heartbeat_mutex_);
    if(!heartbeat_thread_.joinable()) return;
    heartbeat_stop_ = true;
    worker = std::move(heartbeat_thread_);
  }
  heartbeat_cv_.notify_all();
  worker.join();
}

bool PeerClient::heartbeat_running() const {
  std::lock_guard lg(heartbeat_mutex_);
  return heartbeat_thread_.joinable();
}

void PeerClient::heartbeat_loop() {
  std::unique_lock lock(heartbeat_mutex_);
  while(!heartbeat_stop_) {
    if(heartbeat_cv_.wait_for(lock, options_.heartbeat_interval, [this]{ return heartbeat_stop_; })) {
      break;
    }
    lock.unlock();
    send_heartbeat();
    lock.lock();
  }
}
