#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace {
std::shared_ptr<spdlog::logger> g_diag_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_report_logger;
std::shared_ptr<spdlog::logger> g_report_err_logger;
std::once_flag g_create_once;
std::atomic<bool> g_log_passthrough{true};

void create_loggers() {
  auto diag_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  diag_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  auto report_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  report_sink->set_pattern("%v");

  auto report_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  report_err_sink->set_pattern("%v");

  g_diag_logger = std::make_shared<spdlog::logger>("fimbl.diag", std::move(diag_sink));
  g_error_logger = std::make_shared<spdlog::logger>("fimbl.error", std::move(error_sink));
  g_report_logger = std::make_shared<spdlog::logger>("fimbl.report", std::move(report_sink));
  g_report_err_logger = std::make_shared<spdlog::logger>("fimbl.report_err", std::move(report_err_sink));

  g_diag_logger->set_level(spdlog::level::info);
  g_diag_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_report_logger->flush_on(spdlog::level::info);
  g_report_err_logger->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  std::call_once(g_create_once, create_loggers);
}

spdlog::logger* sink_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::report: return g_report_logger.get();
    case LogChannel::report_err: return g_report_err_logger.get();
    case LogChannel::error: return g_error_logger.get();
    default: return g_diag_logger.get();
  }
}

} // namespace

const char* channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::debug: return "debug";
    case LogChannel::info: return "info";
    case LogChannel::warn: return "warn";
    case LogChannel::error: return "error";
    case LogChannel::report: return "report";
    case LogChannel::report_err: return "report_err";
  }
  return "unknown";
}

void init_logging(bool verbose) {
  ensure_loggers();
  g_diag_logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::clear_listeners() {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.clear();
}

bool Logger::dispatch(LogChannel channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  const std::string channel_label = name_.empty()
    ? std::string(channel_name(channel))
    : name_ + ":" + channel_name(channel);
  bool handled = false;
  for(auto& listener : snapshot) {
    if(listener(channel_label, level, message)) {
      handled = true;
    }
  }
  return handled;
}

void Logger::emit(LogChannel channel,
                  spdlog::level::level_enum level,
                  const std::string& message) const {
  detail::emit_to_default(channel, name_, level, message);
}

namespace detail {

void emit_to_default(LogChannel channel,
                     const std::string& logger_name,
                     spdlog::level::level_enum level,
                     const std::string& message) {
  ensure_loggers();
  if(!log_passthrough()) return;

  auto* sink = sink_for(channel);
  if(!sink) return;
  const bool plain = channel == LogChannel::report || channel == LogChannel::report_err;
  if(!plain && !logger_name.empty()) {
    sink->log(level, fmt::format("[{}] {}", logger_name, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
