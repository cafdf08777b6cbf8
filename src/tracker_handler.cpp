#include "tracker_handler.hpp"
#include "errors.hpp"

TrackerProtocolHandler::TrackerProtocolHandler(std::shared_ptr<Registry> registry,
                                               std::shared_ptr<Logger> logger)
  : registry_(std::move(registry)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("tracker")) {}

json TrackerProtocolHandler::handle_line(const std::string& line) {
  try {
    return handle(parse_tracker_command(line));
  } catch(const MalformedCommand& e) {
    logger_->warn("Rejected request '{}': {}", line, e.what());
    return make_error(e.what());
  }
}

json TrackerProtocolHandler::handle(const TrackerCommand& command) {
  return std::visit(overloaded{
    [this](const RegisterCommand& c) { return on_register(c); },
    [this](const UnregisterCommand& c) { return on_unregister(c); },
    [this](const GetPeersCommand&) { return on_get_peers(); },
    [this](const HeartbeatCommand& c) { return on_heartbeat(c); }
  }, command);
}

json TrackerProtocolHandler::on_register(const RegisterCommand& command) {
  auto count = registry_->upsert(command.peer_id, command.ip, command.port);
  logger_->info("Registered peer: {} ({}:{})", command.peer_id, command.ip, command.port);
  logger_->info("Total active peers: {}", count);
  return make_register_ok(count);
}

json TrackerProtocolHandler::on_unregister(const UnregisterCommand& command) {
  if(!registry_->remove(command.peer_id)) {
    return make_error("Peer not found");
  }
  logger_->info("Unregistered peer: {}", command.peer_id);
  logger_->info("Total active peers: {}", registry_->size());
  return make_success("Peer unregistered successfully");
}

json TrackerProtocolHandler::on_get_peers() {
  auto peers = registry_->snapshot();
  logger_->debug("Sending peer list ({} peers)", peers.size());
  return make_peer_list(peers);
}

json TrackerProtocolHandler::on_heartbeat(const HeartbeatCommand& command) {
  if(!registry_->touch(command.peer_id)) {
    logger_->debug("Heartbeat from unknown peer {}", command.peer_id);
    return make_error("Peer not found");
  }
  return make_success("Heartbeat received");
}
