#pragma once

#ifdef ENABLE_LOGGING
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace frontdoor {
namespace logging {

class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }

  void setLevel(spdlog::level::level_enum level) {
    if (logger_) {
      logger_->set_level(level);
    }
  }

  std::shared_ptr<spdlog::logger> getLogger() const { return logger_; }

  // Unknown names fall back to info
  void setLogLevel(const std::string& level_str) {
    auto level = spdlog::level::from_str(level_str);
    if (level == spdlog::level::off && level_str != "off") {
      level = spdlog::level::info;
    }
    setLevel(level);
  }

 private:
  Logger() {
    logger_ = spdlog::get("frontdoor");
    if (!logger_) {
      logger_ = spdlog::stdout_color_mt("frontdoor");
    }
    logger_->set_level(spdlog::level::info);
    logger_->set_pattern("[%H:%M:%S.%e] [%n] [%l] %v");
  }

  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace logging
}  // namespace frontdoor

// Convenience macros for logging
#define FD_LOG_TRACE(...) \
  frontdoor::logging::Logger::getInstance().getLogger()->trace(__VA_ARGS__)
#define FD_LOG_DEBUG(...) \
  frontdoor::logging::Logger::getInstance().getLogger()->debug(__VA_ARGS__)
#define FD_LOG_INFO(...) \
  frontdoor::logging::Logger::getInstance().getLogger()->info(__VA_ARGS__)
#define FD_LOG_WARN(...) \
  frontdoor::logging::Logger::getInstance().getLogger()->warn(__VA_ARGS__)
#define FD_LOG_ERROR(...) \
  frontdoor::logging::Logger::getInstance().getLogger()->error(__VA_ARGS__)
#define FD_LOG_CRITICAL(...) \
  frontdoor::logging::Logger::getInstance().getLogger()->critical(__VA_ARGS__)

#else
// No-op macros when logging is disabled
#define FD_LOG_TRACE(...)
#define FD_LOG_DEBUG(...)
#define FD_LOG_INFO(...)
#define FD_LOG_WARN(...)
#define FD_LOG_ERROR(...)
#define FD_LOG_CRITICAL(...)

#include <string>

namespace frontdoor {
namespace logging {
class Logger {
 public:
  static Logger& getInstance() {
    static Logger instance;
    return instance;
  }
  void setLogLevel(const std::string&) {}
};
}  // namespace logging
}  // namespace frontdoor

#endif
