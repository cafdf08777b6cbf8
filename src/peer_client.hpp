#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"
#include "protocol.hpp"
#include "tracker_client.hpp"

enum class DeliveryStatus { Delivered, UnknownPeer, DeliveryError };

struct DeliveryOutcome {
  std::string peer_id;
  DeliveryStatus status = DeliveryStatus::Delivered;
  std::string error;

  bool delivered() const { return status == DeliveryStatus::Delivered; }
};

// Tracker membership and outbound chat delivery for one peer.
//
// Three threads touch a PeerClient: the command interface (send/refresh),
// the heartbeat thread (HEARTBEAT, re-REGISTER) and whoever stops it. The
// peer cache has its own mutex and the heartbeat thread never reads it.
class PeerClient {
public:
  struct Options {
    std::string peer_id;
    std::string advertise_ip = "127.0.0.1";
    uint16_t port = 0;
    std::string tracker_host = "127.0.0.1";
    uint16_t tracker_port = 5000;
    std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(60)};
    std::chrono::milliseconds io_timeout{5000};
  };

  // Writes one line to host:port. Throws TransportError on failure.
  using LineSender = std::function<void(const std::string& host,
                                        uint16_t port,
                                        const std::string& line,
                                        std::chrono::milliseconds timeout)>;

  explicit PeerClient(Options options, std::shared_ptr<Logger> logger = nullptr);
  ~PeerClient();

  PeerClient(const PeerClient&) = delete;
  PeerClient& operator=(const PeerClient&) = delete;

  // REGISTER, then start the heartbeat thread if it is not running yet.
  bool register_with_tracker();
  // Best-effort UNREGISTER; failures are logged only.
  void unregister_from_tracker();

  // Replaces the cache with the tracker's current list. False (cache kept)
  // when the tracker cannot be reached.
  bool refresh_peers();

  DeliveryOutcome send_direct(const std::string& peer_id, const std::string& content);
  // One outcome per cached peer other than ourselves.
  std::vector<DeliveryOutcome> broadcast(const std::string& content);

  void start_heartbeat();
  void stop_heartbeat();
  bool heartbeat_running() const;
  // One HEARTBEAT now, re-registering if the tracker has forgotten us.
  bool send_heartbeat();

  std::vector<PeerEndpoint> cached_peers() const;
  std::optional<PeerEndpoint> cached_peer(const std::string& peer_id) const;

  void set_line_sender(LineSender sender);

  const Options& options() const { return options_; }
  const std::string& peer_id() const { return options_.peer_id; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  bool register_once();
  DeliveryOutcome deliver(const PeerEndpoint& target, const ChatMessage& message);
  void heartbeat_loop();

  Options options_;
  std::shared_ptr<Logger> logger_;
  TrackerClient tracker_;

  mutable std::mutex cache_mutex_;
  std::vector<PeerEndpoint> cache_;

  mutable std::mutex sender_mutex_;
  LineSender sender_;

  mutable std::mutex heartbeat_mutex_;
  std::condition_variable heartbeat_cv_;
  std::thread heartbeat_thread_;
  bool heartbeat_stop_ = false;
};
