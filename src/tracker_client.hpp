#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "protocol.hpp"

struct TrackerReply {
  bool ok = false;
  std::string message;
  json body;
};

// One connection per request against the tracker. Every call throws
// TrackerUnreachable when the tracker cannot be reached within the timeout
// or answers with something that is not a JSON object.
class TrackerClient {
public:
  TrackerClient(std::string host, uint16_t port, std::chrono::milliseconds timeout);

  TrackerReply register_peer(const std::string& peer_id, const std::string& ip, uint16_t port);
  TrackerReply unregister_peer(const std::string& peer_id);
  TrackerReply heartbeat(const std::string& peer_id);
  std::vector<PeerEndpoint> get_peers();

  TrackerReply send(const TrackerCommand& command);

  const std::string& host() const { return host_; }
  uint16_t port() const { return port_; }

private:
  std::string host_;
  uint16_t port_;
  std::chrono::milliseconds timeout_;
};
