#include <cpptrace/cpptrace.hpp>
#include <filesystem>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "peer_node.hpp"
#include "settings_manager.hpp"

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>(
      PEER_SETTINGS_SPECIFICATION,
      std::filesystem::current_path() / ".config" / "peer.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "peerchat-peer",
                             "Chat peer: registers with a tracker and talks to other peers directly",
                             nlohmann::json::array({ {{"index",0},{"key","peer_id"}},
                                                     {{"index",1},{"key","listen_port"}} }));
    if(!parser.parse(argc, argv, *settings)) {
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage(*settings);
      return 0;
    }

    init(settings->get<bool>("verbose"));

    if(settings->save_requested()) {
      if(!settings->save()) {
        print_err(nullptr, "Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    PeerNode::Options options;
    options.interactive = true;
    PeerNode node(settings, options);
    node.start();
    node.stop_on_signal();
    node.run();

    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("peer-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
