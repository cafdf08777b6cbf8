#include <cpptrace/cpptrace.hpp>
#include <filesystem>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "tracker_server.hpp"

int main(int argc, char** argv){
  try {
    auto settings = std::make_shared<SettingsManager>(
      TRACKER_SETTINGS_SPECIFICATION,
      std::filesystem::current_path() / ".config" / "tracker.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "peerchat-tracker",
                             "Peer registry for peerchat clients",
                             nlohmann::json::array({ {{"index",0},{"key","listen_port"}} }));
    if(!parser.parse(argc, argv, *settings)) {
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage(*settings);
      return 0;
    }

    init(settings->get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("tracker");

    if(settings->save_requested()) {
      if(!settings->save()) {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    TrackerServer::Options options;
    options.listen_ip = settings->get<std::string>("listen_ip");
    options.listen_port = settings->get_port("listen_port", true);
    options.liveness_timeout = settings->get_seconds("liveness_timeout");
    options.sweep_interval = settings->get_seconds("sweep_interval");
    options.io_timeout = settings->get_millis("io_timeout_ms");
    int worker_threads = settings->get<int>("worker_threads");
    if(worker_threads <= 0) {
      logger->error("Invalid worker_threads '{}'", worker_threads);
      return 1;
    }
    options.worker_threads = static_cast<std::size_t>(worker_threads);

    TrackerServer tracker(options, nullptr, logger);
    tracker.start();
    tracker.stop_on_signal();
    tracker.run();

    return 0;
  } catch(std::exception& e) {
    init(false);
    Logger logger("tracker-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}
