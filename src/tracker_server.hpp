#pragma once

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "log.hpp"
#include "registry.hpp"

class Server;
class TrackerProtocolHandler;

class TrackerServer {
public:
  struct Options {
    std::string listen_ip = "0.0.0.0";
    uint16_t listen_port = 5000;
    std::chrono::milliseconds liveness_timeout{std::chrono::seconds(300)};
    std::chrono::milliseconds sweep_interval{std::chrono::seconds(60)};
    std::chrono::milliseconds io_timeout{5000};
    std::size_t worker_threads = 4;
  };

  explicit TrackerServer(Options options,
                         std::shared_ptr<Registry> registry = nullptr,
                         std::shared_ptr<Logger> logger = nullptr);
  ~TrackerServer();

  // Binds the listening socket and arms the sweep timer. Throws if the
  // socket cannot be bound.
  void start();
  // Services connections on worker_threads threads (the caller is one of
  // them) until stop_on_signal fires or stop() is called.
  void run();
  void start_background();
  void stop();

  void stop_on_signal();

  // One sweep pass against the configured liveness timeout.
  std::vector<std::string> sweep_now();

  uint16_t listen_port() const { return listen_port_; }
  const Options& options() const { return options_; }
  std::shared_ptr<Registry> registry() const { return registry_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  void schedule_sweep();
  void spawn_workers(std::size_t count);

  Options options_;
  std::shared_ptr<Registry> registry_;
  std::shared_ptr<Logger> logger_;
  std::shared_ptr<TrackerProtocolHandler> handler_;
  asio::io_context io_;
  std::unique_ptr<Server> server_;
  std::unique_ptr<asio::steady_timer> sweep_timer_;
  std::unique_ptr<asio::signal_set> signals_;
  std::vector<std::thread> workers_;
  std::atomic<bool> started_{false};
  uint16_t listen_port_ = 0;
};
