#pragma once
#include <cstdint>
#include <cstddef>
#include "speedtest/common.hpp"
#include "speedtest/session.hpp"
#include "speedtest/socket.hpp"
#include "speedtest/stats.hpp"

/**
* @file
* @brief UDP transfer session: one Request, a stream of numbered Payload segments.
*
* There are no acknowledgments and no retransmissions. Segments dropped anywhere
* on the path are gone; the client only measures how many bytes arrived.
*/

namespace speedtest {

struct UdpSessionParams {
    Endpoint server;              ///< Server address + advertised UDP port.
    uint64_t file_size     = 0;   ///< Bytes to request.
    int      connection_id = 1;   ///< 1-based number used in reports.
    int      idle_timeout_ms = 1000; ///< Silence after which the transfer is considered over.
};

/**
* @brief Run one client UDP session over @p sock.
*
* @details
* Sends a Request, then accepts Payload datagrams until either the requested
* size has arrived or @ref UdpSessionParams::idle_timeout_ms passes without any
* datagram. Segments may arrive out of order or not at all; only byte and
* segment counts are kept, with the total taken from the first Payload seen.
* Datagrams from any host other than the server's address, and datagrams that
* fail to decode, are ignored.
*
* Never throws; a failed send or receive is reported in @ref SessionResult::error.
*/
SessionResult run_udp_session(ISocket& sock, const UdpSessionParams& params);

struct UdpSendOptions {
    int    pacing_us  = 1000;       ///< Sleep between segments (0 = back to back).
    size_t packet_cap = kPacketCap; ///< Data bytes per segment.
};

/**
* @brief Stream @p file_size bytes to @p to as ceil(file_size / cap) Payload segments.
*
* @details Each call builds its own datagrams; @p sock may be shared with other
* handlers and the broadcaster. Send failures are counted and logged once per
* request, and the remaining segments are still attempted.
*
* @return Number of segments the socket accepted.
*/
uint64_t serve_udp_request(ISocket& sock, const Endpoint& to, uint64_t file_size,
                           const UdpSendOptions& opts, ServerStats& stats);

} // namespace speedtest
