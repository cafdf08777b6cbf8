#include "chat_cli.hpp"

#include <algorithm>
#include <cstdlib>
#include <iostream>

#ifdef HAVE_READLINE
#include <readline/readline.h>
#include <readline/history.h>
#endif

#include "utils.hpp"

namespace {

std::string rest_of_line(std::istringstream& iss) {
  std::string rest;
  std::getline(iss, rest);
  return trim_whitespace(rest);
}

} // namespace

ChatCLI::ChatCLI(std::shared_ptr<PeerClient> client,
                 std::shared_ptr<MessageHistory> history,
                 std::shared_ptr<Logger> logger)
  : client_(std::move(client)), history_(std::move(history)), logger_(std::move(logger)) {}

bool ChatCLI::execute_command(const std::string& line) {
  std::istringstream iss(trim_whitespace(line));
  std::string cmd;
  iss >> cmd;
  if(cmd.empty()) return true;

  if(cmd == "/peers") {
    cmd_peers();
  } else if(cmd == "/msg") {
    cmd_msg(iss);
  } else if(cmd == "/broadcast") {
    cmd_broadcast(iss);
  } else if(cmd == "/refresh") {
    cmd_refresh();
  } else if(cmd == "/history") {
    cmd_history();
  } else if(cmd == "/register") {
    cmd_register();
  } else if(cmd == "/help") {
    print_help();
  } else if(cmd == "/quit") {
    logger_->print("Quitting...");
    return false;
  } else {
    logger_->print("Unknown command. Type /help for available commands");
  }
  return true;
}

void ChatCLI::run_loop() {
  print_help();
  while(true) {
    auto input = read_command_line("> ");
    if(!input) break;
    if(!execute_command(*input)) break;
  }
}

std::optional<std::string> ChatCLI::read_command_line(const char* prompt) {
#ifdef HAVE_READLINE
  char* line = readline(prompt);
  if(!line) return std::nullopt;
  std::string result(line);
  if(!result.empty()) add_history(result.c_str());
  free(line);
  return result;
#else
  std::cout << prompt;
  std::cout.flush();
  std::string line;
  if(!std::getline(std::cin, line)) return std::nullopt;
  return line;
#endif
}

void ChatCLI::print_help() {
  logger_->print("Available commands:");
  logger_->print("  /peers                      Refresh and list known peers");
  logger_->print("  /msg <peer_id> <message>    Send a direct message");
  logger_->print("  /broadcast <message>        Send a message to every peer");
  logger_->print("  /refresh                    Refresh the peer list from the tracker");
  logger_->print("  /history                    Show the last {} received messages", kHistoryLines);
  logger_->print("  /register                   Register with the tracker again");
  logger_->print("  /help                       Show this help message");
  logger_->print("  /quit                       Leave the chat");
}

void ChatCLI::cmd_peers() {
  if(!client_->refresh_peers()) {
    logger_->print_err("Tracker unreachable, showing the cached list");
  }
  auto peers = client_->cached_peers();
  if(peers.empty()) {
    logger_->print("No peers available");
    return;
  }
  logger_->print("Available peers:");
  for(const auto& peer : peers) {
    bool self = peer.peer_id == client_->peer_id();
    logger_->print("  {} - {}:{}{}", peer.peer_id, peer.ip, peer.port, self ? " (you)" : "");
  }
}

void ChatCLI::cmd_msg(std::istringstream& args) {
  std::string peer_id;
  args >> peer_id;
  std::string text = rest_of_line(args);
  if(peer_id.empty() || text.empty()) {
    logger_->print("Usage: /msg <peer_id> <message>");
    return;
  }

  auto outcome = client_->send_direct(peer_id, text);
  switch(outcome.status) {
    case DeliveryStatus::Delivered:
      logger_->print("Message sent to {}", peer_id);
      break;
    case DeliveryStatus::UnknownPeer:
      logger_->print("Peer {} not found. Try /refresh", peer_id);
      break;
    case DeliveryStatus::DeliveryError:
      logger_->print_err("Failed to send message to {}: {}", peer_id, outcome.error);
      break;
  }
}

void ChatCLI::cmd_broadcast(std::istringstream& args) {
  std::string text = rest_of_line(args);
  if(text.empty()) {
    logger_->print("Usage: /broadcast <message>");
    return;
  }

  auto outcomes = client_->broadcast(text);
  if(outcomes.empty()) {
    logger_->print("No other peers to broadcast to");
    return;
  }
  std::size_t delivered = 0;
  for(const auto& outcome : outcomes) {
    if(outcome.delivered()) {
      ++delivered;
    } else {
      logger_->print_err("  {}: {}", outcome.peer_id, outcome.error);
    }
  }
  logger_->print("Broadcast sent to {}/{} peers", delivered, outcomes.size());
}

void ChatCLI::cmd_refresh() {
  if(!client_->refresh_peers()) {
    logger_->print_err("Tracker unreachable, peer list unchanged");
    return;
  }
  auto peers = client_->cached_peers();
  auto others = std::count_if(peers.begin(), peers.end(),
                              [this](const PeerEndpoint& p){ return p.peer_id != client_->peer_id(); });
  logger_->print("Updated peer list: {} peers available", others);
}

void ChatCLI::cmd_history() {
  auto entries = history_->recent(kHistoryLines);
  if(entries.empty()) {
    logger_->print("No messages received yet");
    return;
  }
  logger_->print("Last {} messages:", entries.size());
  for(const auto& entry : entries) {
    logger_->print("  [{}] {}: {}", to_string(entry.message.type), entry.message.from, entry.message.content);
  }
}

void ChatCLI::cmd_register() {
  if(client_->register_with_tracker()) {
    logger_->print("Registered with tracker");
  } else {
    logger_->print_err("Registration failed, try again later");
  }
}
