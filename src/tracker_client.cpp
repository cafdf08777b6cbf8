#include "tracker_client.hpp"

#include "errors.hpp"
#include "transport.hpp"

#include <spdlog/fmt/fmt.h>

TrackerClient::TrackerClient(std::string host, uint16_t port, std::chrono::milliseconds timeout)
  : host_(std::move(host)), port_(port), timeout_(timeout) {}

TrackerReply TrackerClient::send(const TrackerCommand& command) {
  std::string raw;
  try {
    raw = request_line(host_, port_, format_tracker_command(command), timeout_);
  } catch(const TransportError& e) {
    throw TrackerUnreachable(fmt::format("tracker {}:{} unreachable: {}", host_, port_, e.what()));
  }

  auto body = json::parse(raw, nullptr, false);
  if(body.is_discarded() || !body.is_object()) {
    throw TrackerUnreachable(fmt::format("tracker {}:{} sent an invalid response", host_, port_));
  }

  TrackerReply reply;
  reply.ok = is_success(body);
  auto it = body.find("message");
  if(it != body.end() && it->is_string()) {
    reply.message = it->get<std::string>();
  }
  reply.body = std::move(body);
  return reply;
}

TrackerReply TrackerClient::register_peer(const std::string& peer_id, const std::string& ip, uint16_t port) {
  return send(RegisterCommand{peer_id, ip, port});
}

TrackerReply TrackerClient::unregister_peer(const std::string& peer_id) {
  return send(UnregisterCommand{peer_id});
}

TrackerReply TrackerClient::heartbeat(const std::string& peer_id) {
  return send(HeartbeatCommand{peer_id});
}

std::vector<PeerEndpoint> TrackerClient::get_peers() {
  auto reply = send(GetPeersCommand{});
  if(!reply.ok) {
    throw TrackerUnreachable(fmt::format("tracker {}:{} rejected GET_PEERS: {}", host_, port_, reply.message));
  }
  return parse_peer_list(reply.body);
}
