#pragma once
#include <cstdint>
#include <string>

/**
* @file
* @brief Outcome of one transfer session, produced once and never mutated afterwards.
*/

namespace speedtest {

enum class Protocol { TCP, UDP };

inline const char* to_string(Protocol p) { return p == Protocol::TCP ? "TCP" : "UDP"; }

/// Lower bound applied to every measured duration so speeds stay finite.
static constexpr uint64_t kMinElapsedNs = 1000;

/**
* @brief Per-session accounting.
*
* @details
* - @ref bytes_received never exceeds @ref requested_bytes for TCP; for UDP it may
*   be lower because lost segments are not retransmitted.
* - @ref segments_expected / @ref segments_received are meaningful for UDP only
*   (expected = first total seen, 0 if no Payload arrived).
* - A non-empty @ref error marks a failed session; the figures then describe the
*   partial transfer that happened before the failure.
*/
struct SessionResult {
    int         connection_id     = 0;
    Protocol    protocol          = Protocol::TCP;
    uint64_t    requested_bytes   = 0;
    uint64_t    bytes_received    = 0;
    uint64_t    elapsed_ns        = kMinElapsedNs;
    uint64_t    segments_expected = 0;
    uint64_t    segments_received = 0;
    std::string error;

    bool ok() const { return error.empty(); }

    double elapsed_seconds() const { return static_cast<double>(elapsed_ns) / 1e9; }

    /// @brief bytes_received * 8 / elapsed, in bits per second.
    double speed_bps() const { return static_cast<double>(bytes_received) * 8.0 / elapsed_seconds(); }

    /// @brief bytes_received / requested_bytes (0 when nothing was requested).
    double receipt_ratio() const {
        return requested_bytes ? static_cast<double>(bytes_received) / static_cast<double>(requested_bytes) : 0.0;
    }
};

/// @brief Clamp a measured interval to @ref kMinElapsedNs.
inline uint64_t floor_elapsed(uint64_t start_ns, uint64_t end_ns) {
    uint64_t d = end_ns > start_ns ? end_ns - start_ns : 0;
    return d < kMinElapsedNs ? kMinElapsedNs : d;
}

} // namespace speedtest
