#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace {
constexpr const char* kLinePattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> g_info_logger;
std::shared_ptr<spdlog::logger> g_error_logger;
std::shared_ptr<spdlog::logger> g_print_logger;
std::shared_ptr<spdlog::logger> g_print_err_logger;
std::shared_ptr<spdlog::sinks::basic_file_sink_mt> g_file_sink;
std::filesystem::path g_file_sink_path;
std::once_flag g_init_once;
std::mutex g_sink_mutex;
std::atomic<bool> g_log_passthrough{true};

void create_loggers() {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  if(g_info_logger) return;

  auto info_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  info_sink->set_pattern(kLinePattern);

  auto error_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  error_sink->set_pattern(kLinePattern);

  auto plain_out_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  plain_out_sink->set_pattern("%v");

  auto plain_err_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  plain_err_sink->set_pattern("%v");

  g_info_logger = std::make_shared<spdlog::logger>("dupescan.info", std::move(info_sink));
  g_error_logger = std::make_shared<spdlog::logger>("dupescan.error", std::move(error_sink));
  g_print_logger = std::make_shared<spdlog::logger>("dupescan.print", std::move(plain_out_sink));
  g_print_err_logger = std::make_shared<spdlog::logger>("dupescan.print_err", std::move(plain_err_sink));

  spdlog::register_logger(g_info_logger);
  spdlog::register_logger(g_error_logger);
  spdlog::register_logger(g_print_logger);
  spdlog::register_logger(g_print_err_logger);

  g_info_logger->flush_on(spdlog::level::warn);
  g_error_logger->flush_on(spdlog::level::err);
  g_print_logger->flush_on(spdlog::level::info);
  g_print_err_logger->flush_on(spdlog::level::err);
}

void ensure_loggers() {
  if(!g_info_logger) create_loggers();
}

// The file sink records log lines only; plain print output stays on the console.
void attach_file_sink(const std::filesystem::path& log_file) {
  std::lock_guard<std::mutex> lock(g_sink_mutex);
  if(log_file == g_file_sink_path) return;

  auto detach = [](spdlog::logger& logger) {
    auto& sinks = logger.sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), g_file_sink), sinks.end());
  };
  if(g_file_sink) {
    detach(*g_info_logger);
    detach(*g_error_logger);
    g_file_sink.reset();
  }
  g_file_sink_path = log_file;
  if(log_file.empty()) return;

  g_file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), false);
  g_file_sink->set_pattern(kLinePattern);
  g_info_logger->sinks().push_back(g_file_sink);
  g_error_logger->sinks().push_back(g_file_sink);
}

bool passthrough_enabled() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

} // namespace

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

const char* log_channel_name(LogChannel channel) {
  switch(channel) {
    case LogChannel::Info: return "info";
    case LogChannel::Warn: return "warn";
    case LogChannel::Error: return "error";
    case LogChannel::Debug: return "debug";
    case LogChannel::Print: return "print";
    case LogChannel::PrintErr: return "print_err";
  }
  return "info";
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

LogListenerHandle Logger::add_listener(Listener listener, void* user_data) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto id = next_listener_id_++;
  listeners_.emplace(id, ListenerBinding{user_data, std::move(listener)});
  return id;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::publish(LogChannel channel, const std::string& message) {
  const std::string channel_name = name_ + ":" + log_channel_name(channel);
  if(dispatch(channel_name, detail::channel_level(channel), message)) return;
  detail::emit_to_default(channel, name_, message);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> listeners_snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
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
      detail::emit_to_default(LogChannel::Error, name_,
                              fmt::format("log listener failed on {}: {}", channel, e.what()));
    }
  }
  return handled;
}

void init(bool verbose, const std::filesystem::path& log_file) {
  std::call_once(g_init_once, [](){
    create_loggers();
  });

  ensure_loggers();
  attach_file_sink(log_file);

  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  g_info_logger->set_level(level);
  g_error_logger->set_level(spdlog::level::info);
  g_print_logger->set_level(spdlog::level::info);
  g_print_err_logger->set_level(spdlog::level::info);

  spdlog::set_default_logger(g_info_logger);
  spdlog::set_level(level);
}

namespace detail {

spdlog::level::level_enum channel_level(LogChannel channel) {
  switch(channel) {
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Debug: return spdlog::level::debug;
    case LogChannel::Info:
    case LogChannel::Print: return spdlog::level::info;
  }
  return spdlog::level::info;
}

// Print channels carry user-facing text and never get a source tag.
void emit_to_default(LogChannel channel, const std::string& source, const std::string& message) {
  ensure_loggers();
  if(!passthrough_enabled()) return;

  spdlog::logger* sink = nullptr;
  bool tagged = !source.empty();
  switch(channel) {
    case LogChannel::Print:
      sink = g_print_logger.get();
      tagged = false;
      break;
    case LogChannel::PrintErr:
      sink = g_print_err_logger.get();
      tagged = false;
      break;
    case LogChannel::Warn:
    case LogChannel::Error:
      sink = g_error_logger.get();
      break;
    case LogChannel::Info:
    case LogChannel::Debug:
      sink = g_info_logger.get();
      break;
  }

  if(!sink) return;
  const auto level = channel_level(channel);
  if(tagged) {
    sink->log(level, fmt::format("[{}] {}", source, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
