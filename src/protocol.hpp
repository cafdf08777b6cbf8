#pragma once
#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "registry.hpp"

using json = nlohmann::json;

// protocol.hpp
// Tracker requests are one text line per connection; every reply and every
// peer-to-peer message is one JSON document followed by '\n'.

inline constexpr const char* kStatusSuccess = "success";
inline constexpr const char* kStatusError = "error";

struct RegisterCommand {
  std::string peer_id;
  std::string ip;
  uint16_t port = 0;
};

struct UnregisterCommand {
  std::string peer_id;
};

struct GetPeersCommand {};

struct HeartbeatCommand {
  std::string peer_id;
};

using TrackerCommand = std::variant<RegisterCommand,
                                    UnregisterCommand,
                                    GetPeersCommand,
                                    HeartbeatCommand>;

template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Throws MalformedCommand with the text the client should see.
TrackerCommand parse_tracker_command(const std::string& line);
std::string format_tracker_command(const TrackerCommand& command);

// Strict 1-65535 parse; no sign, no trailing junk.
std::optional<uint16_t> parse_port(const std::string& text);

// A registry entry as it appears in a GET_PEERS reply.
struct PeerEndpoint {
  std::string peer_id;
  std::string ip;
  uint16_t port = 0;
};

json make_success(const std::string& message);
json make_error(const std::string& message);
json make_register_ok(std::size_t peer_count);
json make_peer_list(const std::vector<PeerRecord>& peers);

bool is_success(const json& reply);
// Entries with a missing id or an out-of-range port are skipped.
std::vector<PeerEndpoint> parse_peer_list(const json& reply);

enum class MessageType { Direct, Broadcast };

struct ChatMessage {
  MessageType type = MessageType::Direct;
  std::string from;
  std::string content;
};

const char* to_string(MessageType type);
json make_chat_message(const ChatMessage& message);
std::optional<ChatMessage> parse_chat_message(const std::string& line);
