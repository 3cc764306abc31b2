#pragma once
#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <string>
#include <chrono>
#include <netinet/in.h>

/**
* @file
* @brief Protocol constants, endpoint type and tiny utilities shared by client and server.
*
* This header defines:
*  - the fixed protocol constants (magic cookie, message types, packet cap, discovery port),
*  - @ref speedtest::Endpoint : an immutable (IPv4 address, port) pair,
*  - a monotonic nanosecond timestamp provider (@ref speedtest::now_ns),
*  - and a human-readable bit-rate formatter (@ref speedtest::human_bitrate).
*
* @note All functions here are thread-safe and lock-free.
*/

namespace speedtest {

/// Constant prefixing every protocol message. Chosen to be visually distinctive in hex dumps.
static constexpr uint32_t kMagicCookie = 0xABCDDCBA;

/// Message type byte following the cookie.
enum class MessageType : uint8_t {
    Offer   = 0x2,
    Request = 0x3,
    Payload = 0x4,
};

/// Maximum data bytes carried by one Payload segment (also the TCP read chunk).
static constexpr size_t kPacketCap = 1024;

/// Well-known UDP port for Offer broadcasts and the client's discovery bind.
static constexpr uint16_t kDiscoveryPort = 54321;

/// Largest datagram either side expects to receive (header + cap, with headroom).
static constexpr size_t kMaxDatagram = 2048;

/**
* @brief (IPv4 address, port) pair identifying a reachable socket.
*
* @details Address is kept as dotted text for logging; conversion to and from
* @c sockaddr_in happens at the socket boundary. Port is in host byte order.
*/
struct Endpoint {
    std::string address; ///< Dotted IPv4 address, e.g. "192.168.1.7".
    uint16_t    port = 0;///< Port in host byte order.

    bool operator==(const Endpoint& o) const { return address == o.address && port == o.port; }

    /// @brief "address:port" for log lines.
    std::string to_string() const { return address + ":" + std::to_string(port); }

    /// @brief Build a @c sockaddr_in; throws std::invalid_argument on a malformed address.
    sockaddr_in to_sockaddr() const;

    /// @brief Build an Endpoint from a kernel-provided @c sockaddr_in.
    static Endpoint from_sockaddr(const sockaddr_in& sa);
};

/**
* @brief Returns a monotonic timestamp in nanoseconds.
*
* @details Uses @c std::chrono::steady_clock so it will not jump backwards if
*          the system wall clock is adjusted (e.g., by NTP). Only differences
*          between two calls are meaningful.
*/
inline uint64_t now_ns() {
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now().time_since_epoch()).count();
}

/**
* @brief Formats a bit rate as a human-readable string.
*
* @param v Rate in bits per second.
* @return A short string such as @c "500.00 b/s", @c "12.34 Kb/s", @c "1.23 Mb/s" or @c "2.50 Gb/s".
*
* @warning Intended for logs/diagnostics, not for strict machine parsing.
*/
inline std::string human_bitrate(double v) {
    char buf[64];
    if (v > 1e9) snprintf(buf, sizeof(buf), "%.2f Gb/s", v / 1e9);
    else if (v > 1e6) snprintf(buf, sizeof(buf), "%.2f Mb/s", v / 1e6);
    else if (v > 1e3) snprintf(buf, sizeof(buf), "%.2f Kb/s", v / 1e3);
    else snprintf(buf, sizeof(buf), "%.2f b/s", v);
    return std::string(buf);
}

} // namespace speedtest
