#include "registry.hpp"

std::size_t Registry::upsert(const std::string& peer_id, const std::string& ip, uint16_t port) {
  const auto now = Clock::now();
  std::lock_guard lg(m_);
  auto& record = peers_[peer_id];
  record.peer_id = peer_id;
  record.ip = ip;
  record.port = port;
  record.last_heartbeat = now;
  record.registered_at = now;
  return peers_.size();
}

bool Registry::touch(const std::string& peer_id) {
  const auto now = Clock::now();
  std::lock_guard lg(m_);
  auto it = peers_.find(peer_id);
  if(it == peers_.end()) return false;
  it->second.last_heartbeat = now;
  return true;
}

bool Registry::remove(const std::string& peer_id) {
  std::lock_guard lg(m_);
  return peers_.erase(peer_id) > 0;
}

std::vector<PeerRecord> Registry::snapshot() const {
  std::lock_guard lg(m_);
  std::vector<PeerRecord> out;
  out.reserve(peers_.size());
  for(const auto& kv : peers_) {
    out.push_back(kv.second);
  }
  return out;
}

std::optional<PeerRecord> Registry::find(const std::string& peer_id) const {
  std::lock_guard lg(m_);
  auto it = peers_.find(peer_id);
  if(it == peers_.end()) return std::nullopt;
  return it->second;
}

std::size_t Registry::size() const {
  std::lock_guard lg(m_);
  return peers_.size();
}

std::vector<std::string> Registry::sweep(Clock::time_point now, std::chrono::milliseconds timeout) {
  std::vector<std::string> removed;
  std::lock_guard lg(m_);
  for(auto it = peers_.begin(); it != peers_.end();) {
    if(now - it->second.last_heartbeat > timeout) {
      removed.push_back(it->first);
      it = peers_.erase(it);
    } else {
      ++it;
    }
  }
  return removed;
}
