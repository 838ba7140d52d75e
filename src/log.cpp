#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>
#include <vector>

namespace {

constexpr const char* kTimestampPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
constexpr const char* kPlainPattern = "%v";

struct ConsoleSinks {
  std::shared_ptr<spdlog::logger> diagnostics;   // info/warn/debug -> stdout
  std::shared_ptr<spdlog::logger> errors;        // error -> stderr
  std::shared_ptr<spdlog::logger> plain_out;     // print -> stdout, no decoration
  std::shared_ptr<spdlog::logger> plain_err;     // print_err -> stderr, no decoration
};

std::once_flag g_sinks_once;
ConsoleSinks g_sinks;
std::atomic<bool> g_log_passthrough{true};

std::shared_ptr<spdlog::logger> make_console_logger(const std::string& name,
                                                    bool to_stderr,
                                                    const char* pattern) {
  spdlog::sink_ptr sink;
  if(to_stderr) {
    sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  } else {
    sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  }
  sink->set_pattern(pattern);
  auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
  spdlog::register_logger(logger);
  return logger;
}

ConsoleSinks& sinks() {
  std::call_once(g_sinks_once, [](){
    g_sinks.diagnostics = make_console_logger("rcopy.log", false, kTimestampPattern);
    g_sinks.errors = make_console_logger("rcopy.error", true, kTimestampPattern);
    g_sinks.plain_out = make_console_logger("rcopy.print", false, kPlainPattern);
    g_sinks.plain_err = make_console_logger("rcopy.print_err", true, kPlainPattern);

    g_sinks.diagnostics->flush_on(spdlog::level::warn);
    g_sinks.errors->flush_on(spdlog::level::err);
    g_sinks.plain_out->flush_on(spdlog::level::info);
    g_sinks.plain_err->flush_on(spdlog::level::err);
  });
  return g_sinks;
}

spdlog::logger* sink_for(LogChannel channel) {
  auto& s = sinks();
  switch(channel) {
    case LogChannel::Print: return s.plain_out.get();
    case LogChannel::PrintErr: return s.plain_err.get();
    case LogChannel::Error: return s.errors.get();
    default: return s.diagnostics.get();
  }
}

} // namespace

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

void set_log_passthrough(bool enabled) {
  g_log_passthrough.store(enabled, std::memory_order_release);
}

bool log_passthrough() {
  return g_log_passthrough.load(std::memory_order_acquire);
}

void init(bool verbose) {
  auto& s = sinks();
  auto level = verbose ? spdlog::level::debug : spdlog::level::info;
  s.diagnostics->set_level(level);
  s.errors->set_level(spdlog::level::info);
  s.plain_out->set_level(spdlog::level::info);
  s.plain_err->set_level(spdlog::level::info);

  spdlog::set_default_logger(s.diagnostics);
  spdlog::set_level(level);
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

void Logger::emit(LogChannel channel, const std::string& message) {
  const char* base = log_channel_name(channel);
  std::string channel_name = name_.empty() ? std::string(base) : name_ + ":" + base;
  if(dispatch(channel_name, detail::level_for(channel), message)) return;
  detail::emit_to_console(channel, name_, message);
}

bool Logger::dispatch(const std::string& channel,
                      spdlog::level::level_enum level,
                      const std::string& message) {
  std::vector<ListenerBinding> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for(const auto& entry : listeners_) {
      snapshot.push_back(entry.second);
    }
  }
  bool handled = false;
  for(auto& binding : snapshot) {
    try {
      if(binding.callback && binding.callback(binding.user_data, channel, level, message)) {
        handled = true;
      }
    } catch(const std::exception& e) {
      detail::emit_to_console(LogChannel::Error, name_,
                              fmt::format("log listener threw: {}", e.what()));
    }
  }
  return handled;
}

namespace detail {

spdlog::level::level_enum level_for(LogChannel channel) {
  switch(channel) {
    case LogChannel::Warn: return spdlog::level::warn;
    case LogChannel::Error:
    case LogChannel::PrintErr: return spdlog::level::err;
    case LogChannel::Debug: return spdlog::level::debug;
    default: return spdlog::level::info;
  }
}

void emit_to_console(LogChannel channel,
                     const std::string& prefix,
                     const std::string& message) {
  if(!log_passthrough()) return;
  auto* sink = sink_for(channel);
  if(!sink) return;
  const auto level = level_for(channel);
  const bool decorated = channel != LogChannel::Print && channel != LogChannel::PrintErr;
  if(decorated && !prefix.empty()) {
    sink->log(level, fmt::format("[{}] {}", prefix, message));
  } else {
    sink->log(level, message);
  }
}

} // namespace detail
