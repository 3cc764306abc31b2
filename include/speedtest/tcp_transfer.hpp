#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include "speedtest/common.hpp"
#include "speedtest/session.hpp"
#include "speedtest/socket.hpp"
#include "speedtest/stats.hpp"

/**
* @file
* @brief TCP transfer session: client side (announce, receive, time) and server handler.
*
* Exchange:
*  1. client connects and writes the size line ("<n>\n"),
*  2. server streams exactly n filler bytes and closes,
*  3. client reads in @ref kPacketCap chunks until n bytes or EOF and reports
*     elapsed time and speed.
*/

namespace speedtest {

struct TcpSessionParams {
    Endpoint server;                ///< Server address + advertised TCP port.
    uint64_t file_size       = 0;   ///< Bytes to request.
    int      connection_id   = 1;   ///< 1-based number used in reports.
    int      read_timeout_ms = 30000; ///< Bound on each read; expiry fails the session.
};

/**
* @brief Run one client TCP session.
*
* Never throws: connection and I/O failures are caught here and returned in
* @ref SessionResult::error together with the partial byte count and time.
*/
SessionResult run_tcp_session(const TcpSessionParams& params);

struct TcpServeOptions {
    int    read_timeout_ms  = 5000;  ///< Bound on waiting for the size line.
    int    write_timeout_ms = 10000; ///< Bound on a stalled write; a peer that stops reading is dropped.
    size_t max_line        = 32;   ///< Longest accepted size line, delimiter included.
};

/**
* @brief Serve one accepted connection: read the size line, stream filler, close.
*
* A malformed or missing size line is logged and the connection is closed
* without sending data. Write failures, including a peer that stops reading for
* longer than @ref TcpServeOptions::write_timeout_ms, are logged and counted;
* nothing is thrown.
*/
void serve_tcp_connection(TcpStream conn, const Endpoint& peer, const TcpServeOptions& opts,
                          ServerStats& stats);

/**
* @brief Read bytes until '\n' (exclusive) from @p conn.
* @return false on EOF before the delimiter or when @p max_line bytes pass without one.
* @throws SessionIOError on socket errors or read timeout.
*/
bool read_size_line(TcpStream& conn, size_t max_line, std::string& line);

} // namespace speedtest
