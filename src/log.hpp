#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Diagnostic channels go to timestamped sinks; the two report channels are
// plain lines meant for the operator (stdout / stderr).
enum class LogChannel { debug, info, warn, error, report, report_err };

const char* channel_name(LogChannel channel);

void init_logging(bool verbose = false);
void set_log_passthrough(bool enabled);
bool log_passthrough();

using LogListenerHandle = std::size_t;

class Logger {
public:
  // Returning true consumes the line: the default sinks do not see it.
  using Listener = std::function<bool(const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  explicit Logger(std::string name = std::string());

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);
  void clear_listeners();

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::debug, spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::info, spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::warn, spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::error, spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void report(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::report, spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void report_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogChannel::report_err, spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

private:
  template<typename... Args>
  void log(LogChannel channel,
           spdlog::level::level_enum level,
           spdlog::format_string_t<Args...> fmt,
           Args&&... args) {
    auto formatted = fmt::format(fmt, std::forward<Args>(args)...);
    if(dispatch(channel, level, formatted)) return;
    emit(channel, level, formatted);
  }

  bool dispatch(LogChannel channel,
                spdlog::level::level_enum level,
                const std::string& message);
  void emit(LogChannel channel,
            spdlog::level::level_enum level,
            const std::string& message) const;

  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, Listener> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
void emit_to_default(LogChannel channel,
                     const std::string& logger_name,
                     spdlog::level::level_enum level,
                     const std::string& message);
} // namespace detail

// For code that may run without a Logger (settings loading, early startup).
template<typename... Args>
inline void log_error(Logger* logger,
                      spdlog::format_string_t<Args...> fmt,
                      Args&&... args) {
  if(logger) {
    logger->error(fmt, std::forward<Args>(args)...);
  } else {
    detail::emit_to_default(LogChannel::error, std::string(), spdlog::level::err,
                            fmt::format(fmt, std::forward<Args>(args)...));
  }
}
