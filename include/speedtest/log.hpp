#pragma once
#include <string>
#include <sstream>

/**
* @file
* @brief Line-oriented console logging with component tags.
*
* Each call emits exactly one line such as `[server] Sent offer on UDP port 54321`.
* Info/Warn go to stdout, Error to stderr. Lines are written under a process-wide
* mutex so concurrent sessions never interleave within a line.
*
* @code
* speedtest::log_info("client", "Received offer from " + ep.to_string());
* @endcode
*/

namespace speedtest {

enum class LogLevel { Info, Warn, Error };

/// @brief Role colour applied to Info lines when colouring is on.
enum class LogTone { Plain, Peach, Lavender, Blue, Cyan };

/// @brief Enable/disable ANSI colours (on by default).
void set_log_color(bool on);

void log_line(LogLevel level, const std::string& component, const std::string& msg,
              LogTone tone = LogTone::Plain);

inline void log_info(const std::string& component, const std::string& msg, LogTone tone = LogTone::Plain) {
    log_line(LogLevel::Info, component, msg, tone);
}

inline void log_warn(const std::string& component, const std::string& msg) {
    log_line(LogLevel::Warn, component, msg);
}

inline void log_error(const std::string& component, const std::string& msg) {
    log_line(LogLevel::Error, component, msg);
}

} // namespace speedtest
