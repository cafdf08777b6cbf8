#include "chat_cli.hpp"
#include "command_line_parser.hpp"
#include "errors.hpp"
#include "inbound_listener.hpp"
#include "log.hpp"
#include "message_history.hpp"
#include "peer_client.hpp"
#include "peer_node.hpp"
#include "protocol.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "tracker_client.hpp"
#include "tracker_server.hpp"
#include "transport.hpp"
#include "utils.hpp"

#include <asio.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using peerchat::test::TestCase;
using peerchat::test::TestContext;
using peerchat::test::wait_for_condition;

namespace {

bool expect(bool condition, TestContext& ctx, const std::string& what) {
  if(!condition && ctx.verbose) {
    std::cout << "\n    expectation failed: " << what << "\n";
  }
  return condition;
}

std::unique_ptr<TrackerServer> start_tracker(TestContext& ctx) {
  TrackerServer::Options options;
  options.listen_ip = "127.0.0.1";
  options.listen_port = 0;
  options.worker_threads = 2;
  options.io_timeout = 1000ms;
  auto tracker = std::make_unique<TrackerServer>(options);
  ctx.logs.attach(tracker->logger(), "tracker");
  tracker->start_background();
  return tracker;
}

PeerClient::Options client_options(const std::string& peer_id, uint16_t tracker_port) {
  PeerClient::Options options;
  options.peer_id = peer_id;
  options.advertise_ip = "127.0.0.1";
  options.port = 6000;
  options.tracker_host = "127.0.0.1";
  options.tracker_port = tracker_port;
  options.io_timeout = 1000ms;
  return options;
}

// Records every line a PeerClient tries to send; ports listed in `refuse`
// fail the way an unreachable peer does.
struct RecordingSender {
  struct Sent {
    std::string host;
    uint16_t port = 0;
    std::string line;
  };

  std::mutex m;
  std::vector<Sent> sent;
  std::vector<uint16_t> refuse;

  PeerClient::LineSender bind() {
    return [this](const std::string& host, uint16_t port, const std::string& line, std::chrono::milliseconds){
      std::lock_guard lg(m);
      if(std::find(refuse.begin(), refuse.end(), port) != refuse.end()) {
        throw TransportError("connect to " + host + ":" + std::to_string(port) + " failed: Connection refused", false);
      }
      sent.push_back({host, port, line});
    };
  }

  std::size_t count() {
    std::lock_guard lg(m);
    return sent.size();
  }
};

bool test_send_direct_unknown_peer(TestContext& ctx) {
  auto tracker = start_tracker(ctx);
  auto logger = std::make_shared<Logger>("alice");
  ctx.logs.attach(logger);
  PeerClient client(client_options("alice", tracker->listen_port()), logger);
  RecordingSender sender;
  client.set_line_sender(sender.bind());

  auto outcome = client.send_direct("ghost", "hello?");
  tracker->stop();

  bool ok = true;
  ok &= expect(outcome.status == DeliveryStatus::UnknownPeer, ctx, "unknown peer outcome");
  ok &= expect(outcome.peer_id == "ghost", ctx, "outcome names the peer");
  ok &= expect(sender.count() == 0, ctx, "no network call for an unknown peer");
  return ok;
}

bool test_send_direct_uses_cached_endpoint(TestContext& ctx) {
  auto tracker = start_tracker(ctx);
  TrackerClient registrar("127.0.0.1", tracker->listen_port(), 1000ms);
  registrar.register_peer("bob", "127.0.0.1", 6102);

  auto logger = std::make_shared<Logger>("alice");
  ctx.logs.attach(logger);
  PeerClient client(client_options("alice", tracker->listen_port()), logger);
  RecordingSender sender;
  client.set_line_sender(sender.bind());

  bool ok = true;
  ok &= expect(client.refresh_peers(), ctx, "refresh succeeds");
  auto outcome = client.send_direct("bob", "hi bob");
  tracker->stop();

  ok &= expect(outcome.delivered(), ctx, "delivered");
  ok &= expect(sender.count() == 1, ctx, "one line sent");
  if(sender.count() == 1) {
    auto message = parse_chat_message(sender.sent[0].line);
    ok &= expect(sender.sent[0].port == 6102, ctx, "sent to cached port");
    ok &= expect(message && message->type == MessageType::Direct, ctx, "direct message type");
    ok &= expect(message && message->from == "alice" && message->content == "hi bob", ctx, "message fields");
  }
  return ok;
}

bool test_broadcast_partial_failure(TestContext& ctx) {
  auto tracker = start_tracker(ctx);
  TrackerClient registrar("127.0.0.1", tracker->listen_port(), 1000ms);
  registrar.register_peer("alice", "127.0.0.1", 6101);
  registrar.register_peer("bob", "127.0.0.1", 6102);
  registrar.register_peer("carol", "127.0.0.1", 6103);
  registrar.register_peer("dave", "127.0.0.1", 6104);

  auto logger = std::make_shared<Logger>("alice");
  ctx.logs.attach(logger);
  PeerClient client(client_options("alice", tracker->listen_port()), logger);
  RecordingSender sender;
  sender.refuse.push_back(6104);
  client.set_line_sender(sender.bind());
  client.refresh_peers();

  auto outcomes = client.broadcast("hello everyone");
  tracker->stop();

  std::size_t delivered = 0;
  std::size_t failed = 0;
  bool dave_failed = false;
  bool self_included = false;
  for(const auto& outcome : outcomes) {
    if(outcome.delivered()) delivered++;
    if(outcome.status == DeliveryStatus::DeliveryError) {
      failed++;
      dave_failed |= outcome.peer_id == "dave" && !outcome.error.empty();
    }
    self_included |= outcome.peer_id == "alice";
  }

  bool ok = true;
  ok &= expect(outcomes.size() == 3, ctx, "one outcome per other peer");
  ok &= expect(delivered == 2 && failed == 1, ctx, "two delivered, one failure");
  ok &= expect(dave_failed, ctx, "dave reported as failed");
  ok &= expect(!self_included, ctx, "sender skips itself");
  ok &= expect(client.cached_peers().size() == 4, ctx, "cache untouched by failures");
  ok &= expect(ctx.logs.contains("Delivery to dave"), ctx, "failure logged");
  return ok;
}

bool test_send_direct_unreachable_peer(TestContext& ctx) {
  auto tracker = start_tracker(ctx);
  TrackerClient registrar("127.0.0.1", tracker->listen_port(), 1000ms);
  registrar.register_peer("bob", "127.0.0.1", peerchat::test::closed_port());

  auto logger = std::make_shared<Logger>("alice");
  ctx.logs.attach(logger);
  auto options = client_options("alice", tracker->listen_port());
  options.io_timeout = 500ms;
  PeerClient client(options, logger);
  client.refresh_peers();

  auto outcome = client.send_direct("bob", "are you there?");
  tracker->stop();

  bool ok = true;
  ok &= expect(outcome.status == DeliveryStatus::DeliveryError, ctx, "delivery error");
  ok &= expect(!outcome.error.empty(), ctx, "error text present");
  ok &= expect(client.cached_peer("bob").has_value(), ctx, "bob still cached");
  return ok;
}

bool test_tracker_unreachable_is_a_result(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("alice");
  ctx.logs.attach(logger);
  auto options = client_options("alice", peerchat::test::closed_port());
  options.io_timeout = 500ms;
  PeerClient client(options, logger);

  bool ok = true;
  ok &= expect(!client.register_with_tracker(), ctx, "registration fails");
  ok &= expect(!client.heartbeat_running(), ctx, "no heartbeat without registration");
  ok &= expect(!client.refresh_peers(), ctx, "refresh fails");
  ok &= expect(client.cached_peers().empty(), ctx, "cache still empty");
  ok &= expect(!client.send_heartbeat(), ctx, "heartbeat fails quietly");
  client.unregister_from_tracker();
  ok &= expect(ctx.logs.contains("Registration failed"), ctx, "registration failure logged");
  ok &= expect(ctx.logs.contains("Unregister failed"), ctx, "unregister failure logged");
  return ok;
}

bool test_heartbeat_reregisters_after_eviction(TestContext& ctx) {
  auto tracker = start_tracker(ctx);
  auto logger = std::make_shared<Logger>("alice");
  ctx.logs.attach(logger);
  auto options = client_options("alice", tracker->listen_port());
  options.heartbeat_interval = 100ms;
  PeerClient client(options, logger);

  bool ok = true;
  ok &= expect(client.register_with_tracker(), ctx, "registered");
  ok &= expect(client.heartbeat_running(), ctx, "heartbeat started");

  // what a sweep would do
  tracker->registry()->remove("alice");

  bool back = wait_for_condition([&]{
    return tracker->registry()->find("alice").has_value();
  }, 3s);
  ok &= expect(back, ctx, "re-registered by the heartbeat");
  ok &= expect(ctx.logs.wait_for_substring("registering again", 1s), ctx, "re-registration logged");

  client.stop_heartbeat();
  ok &= expect(!client.heartbeat_running(), ctx, "heartbeat stopped");
  tracker->stop();
  return ok;
}

bool test_heartbeat_stop_is_prompt(TestContext& ctx) {
  auto tracker = start_tracker(ctx);
  auto options = client_options("alice", tracker->listen_port());
  options.heartbeat_interval = 60s;
  PeerClient client(options);
  ctx.logs.attach(client.logger());
  client.register_with_tracker();

  auto started = std::chrono::steady_clock::now();
  client.stop_heartbeat();
  auto elapsed = std::chrono::steady_clock::now() - started;
  tracker->stop();
  return expect(elapsed < 2s, ctx, "stop does not wait out the interval");
}

bool test_inbound_listener_delivers(TestContext& ctx) {
  asio::io_context io;
  auto logger = std::make_shared<Logger>("bob");
  ctx.logs.attach(logger);

  std::mutex m;
  std::vector<ChatMessage> received;
  InboundListener listener(io, "127.0.0.1", 0,
    [&](const ChatMessage& message, const std::string&){
      std::lock_guard lg(m);
      received.push_back(message);
    },
    1000ms, logger);
  listener.start();
  std::thread io_thread([&]{ io.run(); });

  const uint16_t port = listener.port();
  send_line("127.0.0.1", port, make_chat_message({MessageType::Direct, "alice", "hi"}).dump(), 1000ms);
  send_line("127.0.0.1", port, "definitely not json", 1000ms);
  send_line("127.0.0.1", port, R"({"type":"shout","from":"eve","content":"x"})", 1000ms);
  send_line("127.0.0.1", port, make_chat_message({MessageType::Broadcast, "carol", "all"}).dump(), 1000ms);

  bool got_both = wait_for_condition([&]{
    std::lock_guard lg(m);
    return received.size() >= 2;
  }, 2s);
  bool dropped = ctx.logs.wait_for_substring("Dropped undecodable message", 1s);

  io.stop();
  io_thread.join();
  listener.close();

  bool ok = true;
  ok &= expect(got_both, ctx, "valid messages delivered");
  std::lock_guard lg(m);
  ok &= expect(received.size() == 2, ctx, "invalid payloads dropped");
  bool saw_direct = false;
  bool saw_broadcast = false;
  for(const auto& message : received) {
    saw_direct |= message.type == MessageType::Direct && message.from == "alice" && message.content == "hi";
    saw_broadcast |= message.type == MessageType::Broadcast && message.from == "carol";
  }
  ok &= expect(saw_direct && saw_broadcast, ctx, "message fields intact");
  ok &= expect(dropped, ctx, "drop logged");
  return ok;
}

bool test_chat_message_decoding(TestContext& ctx) {
  bool ok = true;
  ok &= expect(!parse_chat_message("").has_value(), ctx, "empty");
  ok &= expect(!parse_chat_message("[1,2]").has_value(), ctx, "not an object");
  ok &= expect(!parse_chat_message(R"({"type":"direct","from":7,"content":"x"})").has_value(), ctx, "from not a string");
  ok &= expect(!parse_chat_message(R"({"type":"direct","from":"a"})").has_value(), ctx, "missing content");
  auto message = parse_chat_message(R"({"type":"broadcast","from":"a","content":"multi word text"})");
  ok &= expect(message && message->type == MessageType::Broadcast && message->content == "multi word text",
               ctx, "valid broadcast");
  return ok;
}

bool test_message_history_bounded(TestContext& ctx) {
  MessageHistory history(3);
  for(int i = 0; i < 5; ++i) {
    history.add(ChatMessage{MessageType::Direct, "alice", "m" + std::to_string(i)});
  }
  auto recent = history.recent(10);
  auto last_two = history.recent(2);

  bool ok = true;
  ok &= expect(history.size() == 3, ctx, "bounded size");
  ok &= expect(recent.size() == 3 && recent.front().message.content == "m2", ctx, "oldest dropped first");
  ok &= expect(last_two.size() == 2 && last_two.back().message.content == "m4", ctx, "newest last");
  return ok;
}

bool test_cli_usage_and_unknown_verbs(TestContext& ctx) {
  auto logger = std::make_shared<Logger>("alice");
  ctx.logs.attach(logger);
  auto options = client_options("alice", peerchat::test::closed_port());
  options.io_timeout = 300ms;
  auto client = std::make_shared<PeerClient>(options, logger);
  auto history = std::make_shared<MessageHistory>(10);
  ChatCLI cli(client, history, logger);

  bool ok = true;
  ok &= expect(cli.execute_command("/msg"), ctx, "/msg keeps running");
  ok &= expect(ctx.logs.contains("Usage: /msg <peer_id> <message>"), ctx, "/msg usage");
  cli.execute_command("/msg bob");
  cli.execute_command("/broadcast   ");
  ok &= expect(ctx.logs.contains("Usage: /broadcast <message>"), ctx, "/broadcast usage");
  cli.execute_command("/dance");
  ok &= expect(ctx.logs.contains("Unknown command. Type /help for available commands"), ctx, "unknown verb");
  cli.execute_command("/msg ghost hello there");
  ok &= expect(ctx.logs.contains("Peer ghost not found. Try /refresh"), ctx, "unknown peer");
  cli.execute_command("/history");
  ok &= expect(ctx.logs.contains("No messages received yet"), ctx, "empty history");
  cli.execute_command("/refresh");
  ok &= expect(ctx.logs.contains("Tracker unreachable"), ctx, "refresh failure reported");
  cli.execute_command("/help");
  ok &= expect(ctx.logs.contains("/broadcast <message>"), ctx, "help lists verbs");
  ok &= expect(cli.execute_command(""), ctx, "blank line ignored");
  ok &= expect(!cli.execute_command("/quit"), ctx, "/quit stops the loop");
  return ok;
}

bool test_nodes_chat_end_to_end(TestContext& ctx) {
  auto tracker = start_tracker(ctx);
  const uint16_t tracker_port = tracker->listen_port();

  PeerNode alice(peerchat::test::make_peer_settings("alice", tracker_port), PeerNode::Options{});
  ctx.logs.attach(alice, "alice");
  alice.start();

  PeerNode bob(peerchat::test::make_peer_settings("bob", tracker_port), PeerNode::Options{});
  ctx.logs.attach(bob, "bob");
  bob.start();

  bool ok = true;
  ok &= expect(tracker->registry()->size() == 2, ctx, "both registered");
  ok &= expect(alice.listen_port() != 0 && alice.advertise_ip() == "127.0.0.1", ctx, "alice endpoint");

  bob.execute_command("/peers");
  ok &= expect(ctx.logs.contains("bob: Available peers:"), ctx, "bob lists peers");
  ok &= expect(ctx.logs.contains("bob:   alice - 127.0.0.1:" + std::to_string(alice.listen_port())), ctx, "alice listed");
  ok &= expect(ctx.logs.contains("(you)"), ctx, "self marked");

  bob.execute_command("/msg alice hi");
  ok &= expect(ctx.logs.wait_for_substring("alice: [bob] Direct message: hi", 2s), ctx, "alice shows direct message");
  ok &= expect(ctx.logs.contains("bob: Message sent to alice"), ctx, "bob sees confirmation");

  alice.execute_command("/refresh");
  ok &= expect(ctx.logs.contains("alice: Updated peer list: 1 peers available"), ctx, "alice refresh count");

  alice.execute_command("/broadcast hello all");
  ok &= expect(ctx.logs.wait_for_substring("bob: [alice] Broadcast: hello all", 2s), ctx, "bob shows broadcast");
  ok &= expect(ctx.logs.contains("alice: Broadcast sent to 1/1 peers"), ctx, "broadcast total");

  ok &= expect(wait_for_condition([&]{ return alice.history()->size() == 1; }, 1s), ctx, "alice history");
  bob.execute_command("/history");
  ok &= expect(ctx.logs.contains("bob:   [broadcast] alice: hello all"), ctx, "bob history listing");

  alice.stop();
  ok &= expect(!tracker->registry()->find("alice").has_value(), ctx, "stop unregisters");

  bob.execute_command("/msg alice still there?");
  ok &= expect(ctx.logs.contains("bob: Failed to send message to alice"), ctx, "stale cache entry fails cleanly");

  bob.stop();
  tracker->stop();
  return ok;
}

bool test_node_survives_missing_tracker(TestContext& ctx) {
  auto settings = peerchat::test::make_peer_settings("loner", peerchat::test::closed_port());
  peerchat::test::configure(*settings, "io_timeout_ms", 300);
  PeerNode node(settings, PeerNode::Options{});
  ctx.logs.attach(node, "loner");
  node.start();

  bool ok = true;
  ok &= expect(node.listen_port() != 0, ctx, "listener bound");
  ok &= expect(ctx.logs.contains("use /register to retry"), ctx, "registration failure reported");
  node.execute_command("/register");
  ok &= expect(ctx.logs.contains("Registration failed, try again later"), ctx, "/register retries");
  node.stop();
  return ok;
}

bool test_node_leave_network_unregisters(TestContext& ctx) {
  auto tracker = start_tracker(ctx);
  PeerNode carol(peerchat::test::make_peer_settings("carol", tracker->listen_port()), PeerNode::Options{});
  ctx.logs.attach(carol, "carol");
  carol.start();

  bool ok = true;
  ok &= expect(tracker->registry()->find("carol").has_value(), ctx, "carol registered");
  carol.leave_network();
  ok &= expect(!tracker->registry()->find("carol").has_value(), ctx, "carol unregistered");
  ok &= expect(!carol.client()->heartbeat_running(), ctx, "heartbeat stopped");
  ok &= expect(ctx.logs.contains("carol: Unregistered from tracker"), ctx, "unregister logged before exit");

  carol.stop();
  tracker->stop();
  return ok;
}

bool test_node_bind_failure_is_fatal(TestContext& ctx) {
  asio::io_context io;
  asio::ip::tcp::acceptor holder(io, asio::ip::tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
  const uint16_t taken = holder.local_endpoint().port();

  auto settings = peerchat::test::make_peer_settings("blocked", peerchat::test::closed_port());
  peerchat::test::configure(*settings, "listen_port", taken);
  PeerNode node(settings, PeerNode::Options{});
  ctx.logs.attach(node, "blocked");
  bool threw = false;
  try {
    node.start();
  } catch(const std::system_error&) {
    threw = true;
  }
  return expect(threw, ctx, "start throws when the port is taken");
}

bool test_settings_and_arguments(TestContext& ctx) {
  SettingsManager settings(PEER_SETTINGS_SPECIFICATION);
  CommandLineParser parser("peerchat-peer", "test",
                           nlohmann::json::array({ {{"index",0},{"key","peer_id"}},
                                                   {{"index",1},{"key","listen_port"}} }));
  std::vector<std::string> args = {"peerchat-peer", "alice", "6001", "--tracker_host", "10.1.2.3", "-tp", "5050", "--audio"};
  std::vector<char*> argv;
  for(auto& arg : args) argv.push_back(arg.data());

  bool ok = true;
  ok &= expect(parser.parse(static_cast<int>(argv.size()), argv.data(), settings), ctx, "arguments accepted");
  ok &= expect(settings.get<std::string>("peer_id") == "alice", ctx, "positional peer id");
  ok &= expect(settings.get_port("listen_port", true) == 6001, ctx, "positional port");
  ok &= expect(settings.get<std::string>("tracker_host") == "10.1.2.3", ctx, "long option");
  ok &= expect(settings.get_port("tracker_port", false) == 5050, ctx, "alias option");
  ok &= expect(settings.get<bool>("audio_notifications"), ctx, "bare boolean flag");
  ok &= expect(settings.get_seconds("heartbeat_interval") == std::chrono::seconds(60), ctx, "default interval");

  std::string error;
  ok &= expect(!settings.set_from_string("listen_port", "60x", error), ctx, "junk integer rejected");
  peerchat::test::configure(settings, "tracker_port", 70000);
  bool rejected = false;
  try {
    settings.get_port("tracker_port", false);
  } catch(const std::runtime_error&) {
    rejected = true;
  }
  ok &= expect(rejected, ctx, "out-of-range port rejected");

  auto id = default_peer_id();
  ok &= expect(id.size() == 13 && id.rfind("peer-", 0) == 0, ctx, "derived peer id shape");
  ok &= expect(id == default_peer_id(), ctx, "derived peer id stable within a process");
  return ok;
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"send_direct_unknown_peer", test_send_direct_unknown_peer},
    {"send_direct_uses_cached_endpoint", test_send_direct_uses_cached_endpoint},
    {"broadcast_partial_failure", test_broadcast_partial_failure},
    {"send_direct_unreachable_peer", test_send_direct_unreachable_peer},
    {"tracker_unreachable_is_a_result", test_tracker_unreachable_is_a_result},
    {"heartbeat_reregisters_after_eviction", test_heartbeat_reregisters_after_eviction},
    {"heartbeat_stop_is_prompt", test_heartbeat_stop_is_prompt},
    {"inbound_listener_delivers", test_inbound_listener_delivers},
    {"chat_message_decoding", test_chat_message_decoding},
    {"message_history_bounded", test_message_history_bounded},
    {"cli_usage_and_unknown_verbs", test_cli_usage_and_unknown_verbs},
    {"nodes_chat_end_to_end", test_nodes_chat_end_to_end},
    {"node_survives_missing_tracker", test_node_survives_missing_tracker},
    {"node_leave_network_unregisters", test_node_leave_network_unregisters},
    {"node_bind_failure_is_fatal", test_node_bind_failure_is_fatal},
    {"settings_and_arguments", test_settings_and_arguments}
  };
  return peerchat::test::run_test_cases("peer", tests, argc, argv);
}
