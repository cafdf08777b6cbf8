#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::once_flag g_create_once;
std::atomic<bool> g_log_passthrough{true};

void create_loggers() {
  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_info_logger = std::make_shared<spdlog::logger>("peerchat.info", std::move(info_sink));
  g_error_logger = std::make_shared<spdlog::logger>("peerchat.error", std::move(error_sink));
  g_print_logger = std::make_shared<spdlog::logger>("peerchat.print", std::move(plain_out_sink));
  g_print_err_logger = std::make_shared<spdlog::logger>("peerchat.print_err", std::move(plain_err_sink));

  g_info_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  std::call_once(g_create_once, create_loggers);
}

} // namespace

const char* channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return "debug";
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void flush_logs() {
  for(const auto& logger : {g_info_logger, g_error_logger, g_print_logger, g_print_err_logger}) {
    if(logger) logger->flush();
  }
  std::fflush(nullptr);
}

void init(bool verbose) {
  ensure_loggers();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_info_logger);
  spdlog::set_level(level);
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

void Logger::set_name(std::string name) {
  std::lock_guard lock(name_mutex_);
  name_ = std::move(name);
}

std::string Logger::name() const {
  std::lock_guard lock(name_mutex_);
  return name_;
}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::emit(LogChannel channel, const std::string& message) {
  const std::string label = name();
  const std::string channel_label = label.empty()
    ? std::string(channel_name(channel))
    : label + ":" + channel_name(channel);
  if(dispatch(channel_label, detail::level_for(channel), message)) return;
  detail::emit_to_default(channel, label, message);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard lock(listener_mutex_);
    listeners_snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      listeners_snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : listeners_snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_default(LogChannel::Error, "log",
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

namespace detail {

spdlog::level::level_enum level_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Info:
    case LogChannel::Print: return spdlog::level::info;
  }
  return spdlog::level::info;
}

void emit_to_default(LogChannel channel,
                     const std::string& label,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  spdlog::logger* sink = nullptr;
  switch(channel) {
    case LogChannel::Print: sink = g_print_logger.get(); break;
    case LogChannel::PrintErr: sink = g_print_err_logger.get(); break;
    case LogChannel::Error: sink = g_error_logger.get(); break;
    default: sink = g_info_logger.get(); break;
  }

  // print channels are shown to the user verbatim
  if(label.empty() || channel == LogChannel::Print || channel == LogChannel::PrintErr) {
    sink->log(level_for(channel), message);
  } else {
    sink->log(level_for(channel), fmt::format("[{}] {}", label, message));
  }
}

} // namespace detail
