#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

// Sets up the process-wide sinks. Safe to call more than once; later calls
// only adjust the level and (re)attach the optional file sink.
void init(bool verbose = false, const std::filesystem::path& log_file = {});
// When off, nothing reaches the console or the log file. Listeners still
// receive every line.
void set_log_passthrough(bool enabled);

enum class LogChannel { Info, Warn, Error, Debug, Print, PrintErr };

const char* log_channel_name(LogChannel channel);

using LogListenerHandle = std::size_t;

class Logger {
public:
  // Returning true from a listener keeps the line off the default sinks.
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  explicit Logger(std::string name);

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Error, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Debug, fmt, std::forward<Args>(args)...);
  }

  // Plain user-facing output (no timestamp).
  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::Print, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void emit(LogChannel channel, spdlog::format_string_t<Args...> fmt, Args&&... args) {
    publish(channel, fmt::format(fmt, std::forward<Args>(args)...));
  }

  void publish(LogChannel channel, const std::string& message);

private:
  bool dispatch(const std::string& channel,
                spdlog::level::level_enum level,
                const std::string& message);

  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  std::string name_;
  std::mutex listener_mutex_;
  std::unordered_map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
spdlog::level::level_enum channel_level(LogChannel channel);
void emit_to_default(LogChannel channel, const std::string& source, const std::string& message);

template<typename... Args>
void route(Logger* logger,
           LogChannel channel,
           spdlog::format_string_t<Args...> fmt,
           Args&&... args) {
  if(logger) {
    logger->emit(channel, fmt, std::forward<Args>(args)...);
  } else {
    emit_to_default(channel, std::string(), fmt::format(fmt, std::forward<Args>(args)...));
  }
}
} // namespace detail

// Free helpers for code that may run without a Logger; null goes straight to
// the default sinks.
template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::Warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::Debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::Print, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::route(logger, LogChannel::PrintErr, fmt, std::forward<Args>(args)...);
}
