/**
* @file
* @brief UDP session client loop and per-request segment sender.
*/

#include "speedtest/udp_transfer.hpp"
#include "speedtest/protocol.hpp"
#include "speedtest/log.hpp"

#include <cerrno>
#include <cstring>
#include <thread>
#include <chrono>
#include <vector>

namespace speedtest {

SessionResult run_udp_session(ISocket& sock, const UdpSessionParams& params) {
    SessionResult res;
    res.connection_id = params.connection_id;
    res.protocol = Protocol::UDP;
    res.requested_bytes = params.file_size;

    const auto req = encode_request(params.file_size);
    if (sock.send_to(req.data(), req.size(), params.server) < 0) {
        res.error = std::string("request send failed: ") + strerror(errno);
        return res;
    }

    std::vector<uint8_t> buf(kMaxDatagram);
    Endpoint from;
    const uint64_t start = now_ns();
    while (res.bytes_received < params.file_size) {
        ssize_t r = sock.recv_from(buf, &from, params.idle_timeout_ms);
        if (r < 0) {
            res.error = std::string("receive failed: ") + strerror(errno);
            break;
        }
        if (r == 0) break; // idle timeout: server is done or the rest was lost
        if (from.address != params.server.address) continue;

        PayloadView seg;
        if (decode_payload(buf.data(), static_cast<size_t>(r), seg) != DecodeError::Ok) continue;
        if (res.segments_expected == 0) res.segments_expected = seg.total_segments;
        res.segments_received++;
        res.bytes_received += seg.size;
    }
    res.elapsed_ns = floor_elapsed(start, now_ns());
    return res;
}

uint64_t serve_udp_request(ISocket& sock, const Endpoint& to, uint64_t file_size,
                           const UdpSendOptions& opts, ServerStats& stats) {
    const uint64_t total = total_segments(file_size, opts.packet_cap);
    const std::vector<uint8_t> filler(opts.packet_cap, 0);
    uint64_t sent = 0;
    uint64_t failed = 0;

    for (uint64_t i = 0; i < total; ++i) {
        const size_t len = segment_length(file_size, i, opts.packet_cap);
        const auto pkt = encode_payload(total, i, filler.data(), len);
        if (sock.send_to(pkt.data(), pkt.size(), to) < 0) {
            if (failed++ == 0)
                log_error("server", "UDP " + to.to_string() + ": send failed: " + strerror(errno));
            stats.inc_errors();
        } else {
            sent++;
            stats.inc_segments();
            stats.add_tx_bytes(len);
        }
        if (opts.pacing_us > 0) std::this_thread::sleep_for(std::chrono::microseconds(opts.pacing_us));
    }

    if (failed)
        log_warn("server", "UDP " + to.to_string() + ": " + std::to_string(failed) + " of " +
                 std::to_string(total) + " segments not sent");
    return sent;
}

} // namespace speedtest
