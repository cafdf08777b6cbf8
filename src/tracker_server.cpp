#include "tracker_server.hpp"

#include <csignal>

#include "server.hpp"
#include "tracker_handler.hpp"

TrackerServer::TrackerServer(Options options,
                             std::shared_ptr<Registry> registry,
                             std::shared_ptr<Logger> logger)
  : options_(std::move(options)),
    registry_(registry ? std::move(registry) : std::make_shared<Registry>()),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("tracker")),
    io_(static_cast<int>(options_.worker_threads == 0 ? 1 : options_.worker_threads)) {
  if(options_.worker_threads == 0) options_.worker_threads = 1;
  handler_ = std::make_shared<TrackerProtocolHandler>(registry_, logger_);
}

TrackerServer::~TrackerServer() {
  stop();
}

void TrackerServer::start() {
  if(started_) return;

  auto handler = handler_;
  auto logger = logger_;
  server_ = std::make_unique<Server>(io_,
    options_.listen_ip,
    options_.listen_port,
    [handler, logger](const std::string& line, const std::string& remote) -> std::optional<std::string> {
      logger->debug("Received from {}: {}", remote, line);
      return handler->handle_line(line).dump() + "\n";
    },
    options_.io_timeout,
    logger_,
    Connection::Framing::LineOrChunk);
  listen_port_ = server_->port();
  started_ = true;

  server_->start_accept();
  sweep_timer_ = std::make_unique<asio::steady_timer>(io_);
  schedule_sweep();

  logger_->info("Peer tracker listening on {}:{}", options_.listen_ip, listen_port_);
  logger_->info("Liveness timeout {}s, sweep every {}s",
                std::chrono::duration_cast<std::chrono::seconds>(options_.liveness_timeout).count(),
                std::chrono::duration_cast<std::chrono::seconds>(options_.sweep_interval).count());
}

void TrackerServer::schedule_sweep() {
  if(!sweep_timer_) return;
  sweep_timer_->expires_after(options_.sweep_interval);
  sweep_timer_->async_wait([this](const std::error_code& ec){
    if(ec || !started_) return;
    sweep_now();
    schedule_sweep();
  });
}

std::vector<std::string> TrackerServer::sweep_now() {
  auto removed = registry_->sweep(Registry::Clock::now(), options_.liveness_timeout);
  for(const auto& peer_id : removed) {
    logger_->info("Removing inactive peer: {}", peer_id);
  }
  if(!removed.empty()) {
    logger_->info("Total active peers: {}", registry_->size());
  }
  return removed;
}

void TrackerServer::stop_on_signal() {
  signals_ = std::make_unique<asio::signal_set>(io_, SIGINT, SIGTERM);
  signals_->async_wait([this](const std::error_code& ec, int signo){
    if(ec) return;
    logger_->info("Signal {} received, shutting down", signo);
    io_.stop();
  });
}

void TrackerServer::spawn_workers(std::size_t count) {
  for(std::size_t i = 0; i < count; ++i) {
    workers_.emplace_back([this](){
      io_.run();
    });
  }
}

void TrackerServer::run() {
  if(!started_) start();
  spawn_workers(options_.worker_threads - 1);
  io_.run();
  stop();
}

void TrackerServer::start_background() {
  if(!started_) start();
  if(!workers_.empty()) return;
  spawn_workers(options_.worker_threads);
}

void TrackerServer::stop() {
  if(!started_.exchange(false)) return;

  io_.stop();
  for(auto& worker : workers_) {
    if(worker.joinable()) worker.join();
  }
  workers_.clear();

  // nothing runs on io_ any more; the timer and acceptor can be torn down
  sweep_timer_.reset();
  signals_.reset();
  if(server_) {
    server_->close();
  }
  logger_->info("Tracker stopped");
}
