/**
* @file
* @brief Session result formatting and per-protocol aggregation.
*/

#include "speedtest/report.hpp"
#include "speedtest/common.hpp"

#include <cstdio>
#include <sstream>

namespace speedtest {

std::string format_result(const SessionResult& r) {
    char figures[192];
    snprintf(figures, sizeof(figures), "total time: %.4f seconds, total speed: %.2f bits/second",
             r.elapsed_seconds(), r.speed_bps());

    std::ostringstream oss;
    oss << to_string(r.protocol) << " transfer #" << r.connection_id;
    if (r.ok()) oss << " finished, ";
    else oss << " failed: " << r.error << ", received " << r.bytes_received << " of "
             << r.requested_bytes << " bytes, ";
    oss << figures;
    if (r.protocol == Protocol::UDP) {
        char pct[96];
        snprintf(pct, sizeof(pct), ", percentage of packets received successfully: %.2f%%",
                 r.receipt_ratio() * 100.0);
        oss << pct;
    }
    return oss.str();
}

RunSummary summarize(const std::vector<SessionResult>& results) {
    RunSummary s;
    for (const auto& r : results) {
        ProtocolSummary& p = (r.protocol == Protocol::TCP) ? s.tcp : s.udp;
        p.sessions++;
        p.mean_speed_bps += r.speed_bps();
        p.total_seconds += r.elapsed_seconds();
    }
    if (s.tcp.sessions) s.tcp.mean_speed_bps /= static_cast<double>(s.tcp.sessions);
    if (s.udp.sessions) s.udp.mean_speed_bps /= static_cast<double>(s.udp.sessions);
    return s;
}

/// \cond INTERNAL
namespace {

std::string summary_text(const RunSummary& s, std::string (*speed)(double)) {
    std::ostringstream oss;
    auto line = [&oss, speed](const char* name, const ProtocolSummary& p) {
        char buf[160];
        snprintf(buf, sizeof(buf), "%s transfer mean speed: %s, total time: %.4f sec (%zu sessions)\n",
                 name, speed(p.mean_speed_bps).c_str(), p.total_seconds, p.sessions);
        oss << buf;
    };
    if (s.tcp.sessions) line("TCP", s.tcp);
    if (s.udp.sessions) line("UDP", s.udp);
    if (s.tcp.sessions && s.udp.sessions) {
        oss << (s.tcp.mean_speed_bps > s.udp.mean_speed_bps ? "TCP is faster than UDP in this test!"
                                                             : "UDP is faster than TCP in this test!")
            << "\n";
    }
    return oss.str();
}

std::string mbytes_text(double bps) {
    char buf[64];
    snprintf(buf, sizeof(buf), "%.2f MB/s", to_mbytes_per_second(bps));
    return std::string(buf);
}

} // namespace
/// \endcond

std::string format_summary(const RunSummary& s) {
    return summary_text(s, &human_bitrate);
}

std::string format_experiment_summary(const RunSummary& s) {
    return summary_text(s, &mbytes_text);
}

} // namespace speedtest
