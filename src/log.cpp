/**
* @file
* @brief Console sink for log.hpp: one mutex, one write per line.
*/

#include "speedtest/log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace speedtest {

/// \cond INTERNAL
namespace {

std::mutex        g_log_mu;
std::atomic<bool> g_color{true};

const char* tone_code(LogLevel level, LogTone tone) {
    if (level == LogLevel::Error) return "\033[91m";
    if (level == LogLevel::Warn)  return "\033[93m";
    switch (tone) {
        case LogTone::Peach:    return "\033[38;5;216m";
        case LogTone::Lavender: return "\033[38;5;183m";
        case LogTone::Blue:     return "\033[38;5;111m";
        case LogTone::Cyan:     return "\033[96m";
        case LogTone::Plain:    break;
    }
    return "";
}

} // namespace
/// \endcond

void set_log_color(bool on) { g_color = on; }

void log_line(LogLevel level, const std::string& component, const std::string& msg, LogTone tone) {
    std::ostringstream oss;
    const char* code = g_color ? tone_code(level, tone) : "";
    oss << code << "[" << component << "] " << msg << (*code ? "\033[0m" : "") << "\n";
    const std::string line = oss.str();

    std::lock_guard<std::mutex> lg(g_log_mu);
    std::ostream& os = (level == LogLevel::Error) ? std::cerr : std::cout;
    os << line;
    os.flush();
}

} // namespace speedtest
