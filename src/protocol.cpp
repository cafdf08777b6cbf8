#include "protocol.hpp"
#include "errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace {

std::string upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::toupper(ch)); });
  return value;
}

std::vector<std::string> split_tokens(const std::string& line) {
  std::istringstream iss(line);
  std::vector<std::string> out;
  std::string token;
  while(iss >> token) out.push_back(token);
  return out;
}

void expect_args(const std::vector<std::string>& parts, std::size_t count, const char* usage) {
  if(parts.size() != count + 1) {
    throw MalformedCommand(std::string("Invalid format. Use: ") + usage);
  }
}

std::string string_field(const json& j, const char* key) {
  auto it = j.find(key);
  if(it == j.end() || !it->is_string()) return "";
  return it->get<std::string>();
}

} // namespace

std::optional<uint16_t> parse_port(const std::string& text) {
  if(text.empty() || text.size() > 5) return std::nullopt;
  if(!std::all_of(text.begin(), text.end(), [](unsigned char ch){ return std::isdigit(ch); })) {
    return std::nullopt;
  }
  unsigned long value = std::stoul(text);
  if(value < 1 || value > 65535) return std::nullopt;
  return static_cast<uint16_t>(value);
}

TrackerCommand parse_tracker_command(const std::string& line) {
  auto parts = split_tokens(line);
  if(parts.empty()) {
    throw MalformedCommand("Empty command");
  }
  const auto command = upper(parts[0]);

  if(command == "REGISTER") {
    expect_args(parts, 3, "REGISTER <peer_id> <ip> <port>");
    auto port = parse_port(parts[3]);
    if(!port) {
      throw MalformedCommand("Invalid port '" + parts[3] + "'. Use: REGISTER <peer_id> <ip> <port>");
    }
    return RegisterCommand{parts[1], parts[2], *port};
  }
  if(command == "UNREGISTER") {
    expect_args(parts, 1, "UNREGISTER <peer_id>");
    return UnregisterCommand{parts[1]};
  }
  if(command == "GET_PEERS") {
    expect_args(parts, 0, "GET_PEERS");
    return GetPeersCommand{};
  }
  if(command == "HEARTBEAT") {
    expect_args(parts, 1, "HEARTBEAT <peer_id>");
    return HeartbeatCommand{parts[1]};
  }
  throw MalformedCommand("Unknown command");
}

std::string format_tracker_command(const TrackerCommand& command) {
  return std::visit(overloaded{
    [](const RegisterCommand& c) {
      return "REGISTER " + c.peer_id + " " + c.ip + " " + std::to_string(c.port);
    },
    [](const UnregisterCommand& c) { return "UNREGISTER " + c.peer_id; },
    [](const GetPeersCommand&) { return std::string("GET_PEERS"); },
    [](const HeartbeatCommand& c) { return "HEARTBEAT " + c.peer_id; }
  }, command);
}

json make_success(const std::string& message) {
  json j;
  j["status"] = kStatusSuccess;
  j["message"] = message;
  return j;
}

json make_error(const std::string& message) {
  json j;
  j["status"] = kStatusError;
  j["message"] = message;
  return j;
}

json make_register_ok(std::size_t peer_count) {
  json j = make_success("Peer registered successfully");
  j["peer_count"] = peer_count;
  return j;
}

json make_peer_list(const std::vector<PeerRecord>& peers) {
  json arr = json::array();
  for(const auto& record : peers) {
    json p;
    p["peer_id"] = record.peer_id;
    p["ip"] = record.ip;
    p["port"] = record.port;
    arr.push_back(p);
  }
  json j;
  j["status"] = kStatusSuccess;
  j["peers"] = arr;
  j["peer_count"] = peers.size();
  return j;
}

bool is_success(const json& reply) {
  return reply.is_object() && string_field(reply, "status") == kStatusSuccess;
}

std::vector<PeerEndpoint> parse_peer_list(const json& reply) {
  std::vector<PeerEndpoint> out;
  if(!reply.is_object()) return out;
  auto arr = reply.find("peers");
  if(arr == reply.end() || !arr->is_array()) return out;
  for(const auto& item : *arr) {
    if(!item.is_object()) continue;
    PeerEndpoint endpoint;
    endpoint.peer_id = string_field(item, "peer_id");
    endpoint.ip = string_field(item, "ip");
    auto port = item.find("port");
    if(endpoint.peer_id.empty() || endpoint.ip.empty()) continue;
    if(port == item.end() || !port->is_number_integer()) continue;
    auto value = port->get<int64_t>();
    if(value < 1 || value > 65535) continue;
    endpoint.port = static_cast<uint16_t>(value);
    out.push_back(std::move(endpoint));
  }
  return out;
}

const char* to_string(MessageType type) {
  switch(type) {
    case MessageType::Direct: return "direct";
    case MessageType::Broadcast: return "broadcast";
  }
  return "direct";
}

json make_chat_message(const ChatMessage& message) {
  json j;
  j["type"] = to_string(message.type);
  j["from"] = message.from;
  j["content"] = message.content;
  return j;
}

std::optional<ChatMessage> parse_chat_message(const std::string& line) {
  json j = json::parse(line, nullptr, false);
  if(j.is_discarded() || !j.is_object()) return std::nullopt;

  const auto type = string_field(j, "type");
  ChatMessage message;
  if(type == "direct") {
    message.type = MessageType::Direct;
  } else if(type == "broadcast") {
    message.type = MessageType::Broadcast;
  } else {
    return std::nullopt;
  }
  auto from = j.find("from");
  auto content = j.find("content");
  if(from == j.end() || !from->is_string()) return std::nullopt;
  if(content == j.end() || !content->is_string()) return std::nullopt;
  message.from = from->get<std::string>();
  message.content = content->get<std::string>();
  return message;
}
