#pragma once

#include <functional>
#include <string>

namespace mr::ai {

enum class LogLevel { Info, Warning, Error };

using LogSink =
    std::function<void(LogLevel level, const std::string &message)>;

const char *log_level_name(LogLevel level) noexcept;

// Writes "[mroute] <level>: <message>" lines to std::cerr.
LogSink default_log_sink();

} // namespace mr::ai
