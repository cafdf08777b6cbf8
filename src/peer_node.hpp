#pragma once

#include <asio.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <thread>

#include "log.hpp"

class ChatCLI;
class InboundListener;
class MessageHistory;
class PeerClient;
class SettingsManager;
struct ChatMessage;

// A chat peer: inbound listener on its own io thread, tracker membership with
// heartbeat, bounded history of received messages and the command interface.
class PeerNode {
public:
  struct Options {
    // Attached to a terminal: bell and prompt redraw on incoming messages.
    bool interactive = false;
  };

  PeerNode(std::shared_ptr<SettingsManager> settings, Options options);
  ~PeerNode();

  // Binds the listener (throws on failure), registers, refreshes the cache
  // and starts the heartbeat. A registration failure is logged only.
  void start();
  // Command loop on the calling thread until /quit or end of input.
  void run();
  void stop();

  // Unregister and exit the process on SIGINT/SIGTERM.
  void stop_on_signal();
  // Stops the heartbeat, unregisters and flushes output. Leaves the listener
  // and io thread running.
  void leave_network();

  // Returns false for /quit.
  bool execute_command(const std::string& line);

  std::shared_ptr<Logger> logger() const { return logger_; }
  std::shared_ptr<PeerClient> client() const { return client_; }
  std::shared_ptr<MessageHistory> history() const { return history_; }

  uint16_t listen_port() const { return listen_port_; }
  const std::string& peer_id() const { return peer_id_; }
  const std::string& advertise_ip() const { return advertise_ip_; }

private:
  void on_message(const ChatMessage& message, const std::string& remote);

  Options options_;
  std::shared_ptr<SettingsManager> settings_;
  std::shared_ptr<Logger> logger_;
  asio::io_context io_;
  std::thread io_thread_;
  std::unique_ptr<asio::signal_set> signals_;
  std::unique_ptr<InboundListener> listener_;
  std::shared_ptr<PeerClient> client_;
  std::shared_ptr<MessageHistory> history_;
  std::unique_ptr<ChatCLI> cli_;
  bool started_ = false;
  bool audio_notifications_ = false;
  std::string peer_id_;
  std::string advertise_ip_;
  uint16_t listen_port_ = 0;
};
