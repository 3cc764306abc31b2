#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "speedtest/session.hpp"

/**
* @file
* @brief Result lines for single sessions and the per-protocol summary of a run.
*
* The summary is limited to mean speed and elapsed time per protocol.
*/

namespace speedtest {

/**
* @brief One line per session.
*
* @code
* TCP transfer #1 finished, total time: 0.0042 seconds, total speed: 124830147.21 bits/second
* UDP transfer #2 finished, total time: 1.0113 seconds, total speed: 11679.80 bits/second, percentage of packets received successfully: 59.04%
* @endcode
* Failed sessions read "... #n failed: <reason>, ..." followed by the partial figures.
*/
std::string format_result(const SessionResult& r);

struct ProtocolSummary {
    size_t sessions       = 0;
    double mean_speed_bps = 0.0; ///< Arithmetic mean of per-session speeds.
    double total_seconds  = 0.0; ///< Sum of per-session elapsed times.
};

struct RunSummary {
    ProtocolSummary tcp;
    ProtocolSummary udp;
};

RunSummary summarize(const std::vector<SessionResult>& results);

/// @brief Two "mean speed / total time" lines plus which protocol was faster (if both ran).
std::string format_summary(const RunSummary& s);

/// @brief Bits per second to MB/s (2^20 bytes).
inline double to_mbytes_per_second(double bps) { return bps / 8.0 / (1024.0 * 1024.0); }

/**
* @brief Same shape as @ref format_summary with mean speeds in MB/s, for the
* size/count comparison table.
*/
std::string format_experiment_summary(const RunSummary& s);

} // namespace speedtest
