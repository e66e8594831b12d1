#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

// Where a line ends up when no listener claims it. The two log streams carry
// a timestamp and level; the print streams are bare text for usage output
// and the end-of-run summary.
enum class LogStream {
  log,
  log_err,
  print,
  print_err
};

// Sets up the console streams and, when log_file is non-empty, an
// append-mode file that records both log streams down to debug.
void init(bool verbose = false, const std::string& log_file = std::string());

// Off while the test runners capture output through listeners.
void set_log_passthrough(bool enabled);

using LogListenerHandle = std::size_t;

// Named front end for the shared streams. Components get their own Logger
// (usually a child of the pipeline's) so tests can listen to one component.
class Logger {
public:
  // Returning true claims the line and keeps it off the console.
  using Listener = std::function<bool(void* user_data,
                                      const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  explicit Logger(std::string name = std::string());

  const std::string& name() const { return name_; }

  // Logger named "<name>/<suffix>" whose lines also reach this logger's
  // listeners. The parent must outlive the child.
  std::shared_ptr<Logger> child(const std::string& suffix);

  LogListenerHandle add_listener(Listener listener, void* user_data = nullptr);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogStream::log, spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogStream::log, spdlog::level::warn, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogStream::log_err, spdlog::level::err, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogStream::log, spdlog::level::debug, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void print(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    log(LogStream::print, spdlog::level::info, fmt, std::forward<Args>(args)...);
  }

  template<typename... Args>
  void log(LogStream stream,
           spdlog::level::level_enum level,
           spdlog::format_string_t<Args...> fmt,
           Args&&... args) {
    write(stream, level, fmt::format(fmt, std::forward<Args>(args)...));
  }

  void write(LogStream stream, spdlog::level::level_enum level, const std::string& message);

private:
  struct ListenerBinding {
    void* user_data = nullptr;
    Listener callback;
  };

  bool notify(const std::string& channel,
              spdlog::level::level_enum level,
              const std::string& message);

  std::string name_;
  Logger* parent_ = nullptr;
  std::mutex listener_mutex_;
  std::map<LogListenerHandle, ListenerBinding> listeners_;
  std::atomic<LogListenerHandle> next_listener_id_{1};
};

namespace detail {
// Writes straight to a stream, prefixed with "[channel]" when one is given.
void emit(LogStream stream,
          spdlog::level::level_enum level,
          const std::string& channel,
          const std::string& message);

template<typename... Args>
void log_to(Logger* logger,
            LogStream stream,
            spdlog::level::level_enum level,
            spdlog::format_string_t<Args...> fmt,
            Args&&... args) {
  auto formatted = fmt::format(fmt, std::forward<Args>(args)...);
  if(logger) {
    logger->write(stream, level, formatted);
  } else {
    emit(stream, level, std::string(), formatted);
  }
}
} // namespace detail

// Free helpers for code that may run without a Logger (nullptr goes
// straight to the console).
template<typename... Args>
inline void log_info(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, LogStream::log, spdlog::level::info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_warn(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, LogStream::log, spdlog::level::warn, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_error(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, LogStream::log_err, spdlog::level::err, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void log_debug(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, LogStream::log, spdlog::level::debug, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_out(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, LogStream::print, spdlog::level::info, fmt, std::forward<Args>(args)...);
}

template<typename... Args>
inline void print_err(Logger* logger, spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::log_to(logger, LogStream::print_err, spdlog::level::err, fmt, std::forward<Args>(args)...);
}
