#include "mr/ai/log.hpp"

#include <iostream>
#include <mutex>

namespace mr::ai {

namespace {
std::mutex &stderr_mutex() {
  static std::mutex mutex;
  return mutex;
}
} // namespace

const char *log_level_name(LogLevel level) noexcept {
  switch (level) {
  case LogLevel::Info:
    return "info";
  case LogLevel::Warning:
    return "warning";
  case LogLevel::Error:
    return "error";
  }
  return "info";
}

LogSink default_log_sink() {
  return [](LogLevel level, const std::string &message) {
    std::lock_guard<std::mutex> lock(stderr_mutex());
    std::cerr << "[mroute] " << log_level_name(level) << ": " << message
              << '\n';
  };
}

} // namespace mr::ai
