#pragma once
#include <memory>
#include <string>

#include "log.hpp"
#include "protocol.hpp"
#include "registry.hpp"

// Turns one tracker request line into exactly one JSON reply. Never throws
// for bad input; malformed requests become {"status":"error",...}.
class TrackerProtocolHandler {
public:
  TrackerProtocolHandler(std::shared_ptr<Registry> registry,
                         std::shared_ptr<Logger> logger);

  json handle_line(const std::string& line);
  json handle(const TrackerCommand& command);

private:
  json on_register(const RegisterCommand& command);
  json on_unregister(const UnregisterCommand& command);
  json on_get_peers();
  json on_heartbeat(const HeartbeatCommand& command);

  std::shared_ptr<Registry> registry_;
  std::shared_ptr<Logger> logger_;
};
