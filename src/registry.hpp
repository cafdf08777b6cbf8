#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

struct PeerRecord {
  using Clock = std::chrono::steady_clock;

  std::string peer_id;
  std::string ip;
  uint16_t port = 0;
  Clock::time_point last_heartbeat{};
  Clock::time_point registered_at{};
};

// Tracker-side table of live peers. Every operation takes the same lock, so
// operations are linearizable with respect to each other. Callers only ever
// see copies.
class Registry {
public:
  using Clock = PeerRecord::Clock;

  // Inserts or overwrites (last writer wins). Returns the record count after
  // the write.
  std::size_t upsert(const std::string& peer_id, const std::string& ip, uint16_t port);

  // Refreshes last_heartbeat. False, and nothing changes, for an unknown id.
  bool touch(const std::string& peer_id);

  bool remove(const std::string& peer_id);

  std::vector<PeerRecord> snapshot() const;
  std::optional<PeerRecord> find(const std::string& peer_id) const;
  std::size_t size() const;

  // Drops every record whose last heartbeat is older than `timeout` at `now`
  // and returns the dropped ids.
  std::vector<std::string> sweep(Clock::time_point now, std::chrono::milliseconds timeout);

private:
  mutable std::mutex m_;
  std::unordered_map<std::string, PeerRecord> peers_;
};
