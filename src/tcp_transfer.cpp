/**
* @file
* @brief TCP session client and per-connection server handler.
*/

#include "speedtest/tcp_transfer.hpp"
#include "speedtest/protocol.hpp"
#include "speedtest/errors.hpp"
#include "speedtest/log.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace speedtest {

/// \cond INTERNAL
namespace {

// Read-only filler shared by every handler; content is irrelevant to the measurement.
const std::vector<uint8_t>& filler_block() {
    static const std::vector<uint8_t> block(64 * 1024, 0);
    return block;
}

} // namespace
/// \endcond

SessionResult run_tcp_session(const TcpSessionParams& params) {
    SessionResult res;
    res.connection_id = params.connection_id;
    res.protocol = Protocol::TCP;
    res.requested_bytes = params.file_size;

    TcpStream conn;
    try {
        conn = TcpStream::connect(params.server);
        conn.set_recv_timeout(params.read_timeout_ms);
        const std::string line = encode_size_line(params.file_size);
        conn.write_all(reinterpret_cast<const uint8_t*>(line.data()), line.size());
    } catch (const SessionIOError& e) {
        res.error = std::string("connect/announce failed: ") + e.what();
        return res;
    }

    uint8_t buf[kPacketCap];
    const uint64_t start = now_ns();
    try {
        while (res.bytes_received < params.file_size) {
            const uint64_t left = params.file_size - res.bytes_received;
            const size_t want = static_cast<size_t>(std::min<uint64_t>(left, sizeof(buf)));
            const size_t n = conn.read_some(buf, want);
            if (n == 0) break; // peer closed
            res.bytes_received += n;
        }
    } catch (const SessionIOError& e) {
        res.error = std::string("transfer failed: ") + e.what();
    }
    res.elapsed_ns = floor_elapsed(start, now_ns());
    return res;
}

bool read_size_line(TcpStream& conn, size_t max_line, std::string& line) {
    line.clear();
    char c = 0;
    // Byte-wise so nothing past the delimiter is consumed.
    while (line.size() < max_line) {
        size_t n = conn.read_some(reinterpret_cast<uint8_t*>(&c), 1);
        if (n == 0) return false;
        if (c == '\n') return true;
        line.push_back(c);
    }
    return false;
}

void serve_tcp_connection(TcpStream conn, const Endpoint& peer, const TcpServeOptions& opts,
                          ServerStats& stats) {
    const std::string who = "TCP " + peer.to_string();
    try {
        conn.set_recv_timeout(opts.read_timeout_ms);
        conn.set_send_timeout(opts.write_timeout_ms);
        std::string line;
        uint64_t file_size = 0;
        if (!read_size_line(conn, opts.max_line, line)) {
            log_error("server", who + ": missing or oversized size announcement");
            stats.inc_errors();
            return;
        }
        if (!parse_size_line(line, file_size)) {
            log_error("server", who + ": invalid size announcement '" + line + "'");
            stats.inc_errors();
            return;
        }
        log_info("server", who + ": request for " + std::to_string(file_size) + " bytes", LogTone::Lavender);

        const auto& block = filler_block();
        uint64_t left = file_size;
        while (left > 0) {
            const size_t n = static_cast<size_t>(std::min<uint64_t>(left, block.size()));
            conn.write_all(block.data(), n);
            stats.add_tx_bytes(n);
            left -= n;
        }
        log_info("server", who + ": transfer complete", LogTone::Lavender);
    } catch (const SessionIOError& e) {
        log_error("server", who + ": " + e.what());
        stats.inc_errors();
    }
}

} // namespace speedtest
