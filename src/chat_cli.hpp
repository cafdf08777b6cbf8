#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "log.hpp"
#include "message_history.hpp"
#include "peer_client.hpp"

// Line-oriented command interface. Every verb starts with '/'; output goes
// to the logger's print channel.
class ChatCLI {
public:
  static constexpr std::size_t kHistoryLines = 20;

  ChatCLI(std::shared_ptr<PeerClient> client,
          std::shared_ptr<MessageHistory> history,
          std::shared_ptr<Logger> logger);

  // Runs one command line. Returns false once /quit is seen.
  bool execute_command(const std::string& line);

  // Prompts and executes lines from the terminal until /quit or EOF.
  void run_loop();

  void print_help();

private:
  std::optional<std::string> read_command_line(const char* prompt);

  void cmd_peers();
  void cmd_msg(std::istringstream& args);
  void cmd_broadcast(std::istringstream& args);
  void cmd_refresh();
  void cmd_history();
  void cmd_register();

  std::shared_ptr<PeerClient> client_;
  std::shared_ptr<MessageHistory> history_;
  std::shared_ptr<Logger> logger_;
};
