#include "log.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <vector>

namespace {

constexpr const char* kTimestampPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

struct StreamSpec {
  const char* name;
  bool to_stderr;
  bool timestamped;
  spdlog::level::level_enum flush_on;
};

// Indexed by LogStream.
constexpr std::array<StreamSpec, 4> kStreams = {{
  {"sam_declare",           false, true,  spdlog::level::warn},
  {"sam_declare.error",     true,  true,  spdlog::level::err},
  {"sam_declare.print",     false, false, spdlog::level::info},
  {"sam_declare.print_err", true,  false, spdlog::level::err},
}};

std::array<std::shared_ptr<spdlog::logger>, kStreams.size()> g_streams;
std::shared_ptr<spdlog::sinks::basic_file_sink_mt> g_file_sink;
std::mutex g_init_mutex;
std::atomic<bool> g_passthrough{true};

std::size_t index_of(LogStream stream) {
  return static_cast<std::size_t>(stream);
}

spdlog::sink_ptr make_console_sink(const StreamSpec& spec) {
  spdlog::sink_ptr sink;
  if(spec.to_stderr) {
    sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  } else {
    sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  }
  sink->set_pattern(spec.timestamped ? kTimestampPattern : "%v");
  return sink;
}

// Caller holds g_init_mutex.
void create_streams_locked() {
  if(g_streams[0]) return;
  for(std::size_t i = 0; i < kStreams.size(); ++i) {
    const auto& spec = kStreams[i];
    auto logger = std::make_shared<spdlog::logger>(spec.name, make_console_sink(spec));
    logger->flush_on(spec.flush_on);
    g_streams[i] = logger;
  }
}

spdlog::logger& stream_logger(LogStream stream) {
  std::lock_guard<std::mutex> lock(g_init_mutex);
  create_streams_locked();
  return *g_streams[index_of(stream)];
}

// The file wants debug lines even when the console does not, so filtering
// moves from the loggers to their sinks.
void attach_file_sink_locked(const std::string& log_file, spdlog::level::level_enum console_level) {
  if(log_file.empty() || g_file_sink) return;
  g_file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  g_file_sink->set_pattern(kTimestampPattern);
  g_file_sink->set_level(spdlog::level::debug);
  for(auto stream : {LogStream::log, LogStream::log_err}) {
    auto& logger = g_streams[index_of(stream)];
    for(auto& sink : logger->sinks()) {
      sink->set_level(console_level);
    }
    logger->sinks().push_back(g_file_sink);
    logger->set_level(spdlog::level::debug);
  }
}

} // namespace

void init(bool verbose, const std::string& log_file) {
  const auto console_level = verbose ? spdlog::level::debug : spdlog::level::info;
  std::lock_guard<std::mutex> lock(g_init_mutex);
  create_streams_locked();
  for(std::size_t i = 0; i < kStreams.size(); ++i) {
    g_streams[i]->set_level(i == index_of(LogStream::log) ? console_level : spdlog::level::info);
  }
  attach_file_sink_locked(log_file, console_level);
  spdlog::set_default_logger(g_streams[index_of(LogStream::log)]);
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled, std::memory_order_release);
}

Logger::Logger(std::string name) : name_(std::move(name)) {}

std::shared_ptr<Logger> Logger::child(const std::string& suffix) {
  auto out = std::make_shared<Logger>(name_.empty() ? suffix : name_ + "/" + suffix);
  out->parent_ = this;
  return out;
}

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

void Logger::write(LogStream stream, spdlog::level::level_enum level, const std::string& message) {
  if(notify(name_, level, message)) return;
  const bool bare = (stream == LogStream::print || stream == LogStream::print_err);
  detail::emit(stream, level, bare ? std::string() : name_, message);
}

// Listeners run outside the lock so one may log or detach itself.
bool Logger::notify(const std::string& channel,
                    spdlog::level::level_enum level,
                    const std::string& message) {
  std::vector<ListenerBinding> bindings;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    for(const auto& entry : listeners_) {
      bindings.push_back(entry.second);
    }
  }
  bool claimed = false;
  for(auto& binding : bindings) {
    try {
      claimed = binding.callback(binding.user_data, channel, level, message) || claimed;
    } catch(const std::exception& e) {
      detail::emit(LogStream::log_err, spdlog::level::err, "log",
                   fmt::format("listener on {} threw: {}", channel, e.what()));
    }
  }
  if(parent_ && parent_->notify(channel, level, message)) {
    claimed = true;
  }
  return claimed;
}

namespace detail {

void emit(LogStream stream,
          spdlog::level::level_enum level,
          const std::string& channel,
          const std::string& message) {
  auto& logger = stream_logger(stream);
  if(!g_passthrough.load(std::memory_order_acquire)) return;
  if(channel.empty()) {
    logger.log(level, message);
  } else {
    logger.log(level, fmt::format("[{}] {}", channel, message));
  }
}

} // namespace detail
