#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>

namespace pqlens {

enum class LogLevel { DEBUG, INFO, WARN, ERROR, OFF };

class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }

  void setLevel(LogLevel level) { spdlog::set_level(to_spdlog(level)); }

  // Replaces the stderr logger; everything logged afterwards goes to
  // @p filename.
  bool setLogToFile(const std::string& filename) {
    try {
      auto file_sink =
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false);
      auto file_logger =
          std::make_shared<spdlog::logger>("pqlens_file", file_sink);
      file_logger->set_level(spdlog::get_level());
      spdlog::set_default_logger(file_logger);
      spdlog::set_pattern(kPattern);
      return true;
    } catch (const spdlog::spdlog_ex& ex) {
      spdlog::error("Log initialization failed: {}", ex.what());
      return false;
    }
  }

  template <typename... Args>
  void log(spdlog::level::level_enum level,
           const std::source_location& location,
           spdlog::format_string_t<Args...> fmt, Args&&... args) {
    if (!spdlog::should_log(level)) {
      return;
    }
    std::string_view path(location.file_name());
    size_t pos = path.find_last_of("/\\");
    std::string_view filename =
        (pos == std::string_view::npos) ? path : path.substr(pos + 1);

    std::string message =
        spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...);
    spdlog::log(level, "{} [{}:{}]", message, filename, location.line());
  }

 private:
  static constexpr const char* kPattern = "%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v";

  Logger() {
    auto err_logger = spdlog::stderr_color_mt("pqlens");
    spdlog::set_default_logger(err_logger);
    spdlog::set_pattern(kPattern);
    spdlog::set_level(spdlog::level::warn);
  }

  static spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
      case LogLevel::DEBUG:
        return spdlog::level::debug;
      case LogLevel::INFO:
        return spdlog::level::info;
      case LogLevel::WARN:
        return spdlog::level::warn;
      case LogLevel::ERROR:
        return spdlog::level::err;
      case LogLevel::OFF:
        return spdlog::level::off;
    }
    return spdlog::level::warn;
  }

  Logger(const Logger&) = delete;
  Logger& operator=(const Logger&) = delete;
};

// The format string is wrapped together with the caller's location so the
// variadic helpers can still capture std::source_location::current().
template <typename... Args>
struct FormatWithLocation {
  spdlog::format_string_t<Args...> fmt;
  std::source_location location;

  template <typename S>
  consteval FormatWithLocation(
      const S& s,
      std::source_location loc = std::source_location::current())
      : fmt(s), location(loc) {}
};

template <typename... Args>
using LogFormat = FormatWithLocation<std::type_identity_t<Args>...>;

template <typename... Args>
inline void log_debug(LogFormat<Args...> fmt, Args&&... args) {
  Logger::getInstance().log(spdlog::level::debug, fmt.location, fmt.fmt,
                            std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_info(LogFormat<Args...> fmt, Args&&... args) {
  Logger::getInstance().log(spdlog::level::info, fmt.location, fmt.fmt,
                            std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_warn(LogFormat<Args...> fmt, Args&&... args) {
  Logger::getInstance().log(spdlog::level::warn, fmt.location, fmt.fmt,
                            std::forward<Args>(args)...);
}

template <typename... Args>
inline void log_error(LogFormat<Args...> fmt, Args&&... args) {
  Logger::getInstance().log(spdlog::level::err, fmt.location, fmt.fmt,
                            std::forward<Args>(args)...);
}

// Prefixes every message with the owning component, e.g. "cache: miss [0,10)".
class ContextLogger {
 public:
  explicit ContextLogger(std::string prefix) : prefix_(std::move(prefix)) {}

  template <typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) const {
    if (!spdlog::should_log(spdlog::level::debug)) return;
    log_debug("{}: {}", prefix_,
              spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) const {
    log_info("{}: {}", prefix_,
             spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) const {
    log_warn("{}: {}", prefix_,
             spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...));
  }

  template <typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) const {
    log_error("{}: {}", prefix_,
              spdlog::fmt_lib::format(fmt, std::forward<Args>(args)...));
  }

 private:
  std::string prefix_;
};

}  // namespace pqlens

#endif  // LOGGER_HPP
