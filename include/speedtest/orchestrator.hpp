#pragma once
#include <functional>
#include <memory>
#include <vector>
#include "speedtest/discovery.hpp"
#include "speedtest/session.hpp"
#include "speedtest/socket.hpp"
#include "speedtest/task_group.hpp"

/**
* @file
* @brief Client-side fan-out: one thread per TCP/UDP session, results gathered after all finish.
*/

namespace speedtest {

/// @brief Read-only parameters shared by every session of one run.
struct RunParams {
    ServerInfo server;                     ///< Where the offer came from.
    uint64_t   file_size           = 0;    ///< Bytes requested by each session.
    int        tcp_count           = 0;    ///< Concurrent TCP sessions.
    int        udp_count           = 0;    ///< Concurrent UDP sessions.
    int        udp_idle_timeout_ms = 1000; ///< See @ref UdpSessionParams::idle_timeout_ms.
    int        tcp_read_timeout_ms = 30000;///< See @ref TcpSessionParams::read_timeout_ms.
};

/**
* @brief Launches tcp_count + udp_count independent sessions and waits for all of them.
*
* @details
* Each session thread writes only its own slot of the result vector, so no
* locking is needed. A failing session is reported in its own result and does
* not affect siblings. A session whose thread cannot be started gets a failed
* result of its own; sessions already running are still joined.
*
* @par Socket injection
* UDP sessions obtain their socket from a factory (defaults to @ref UdpSocket) so
* tests can substitute @ref MockSocket.
*/
class Orchestrator {
public:
    using SocketFactory = std::function<std::unique_ptr<ISocket>()>;

    explicit Orchestrator(RunParams params, SocketFactory udp_factory = nullptr,
                          ThreadLauncher launch = nullptr);

    /**
     * @brief Run every session concurrently and join them.
     * @return TCP results (connection 1..tcp_count) followed by UDP results (1..udp_count).
     */
    std::vector<SessionResult> run();

private:
    SessionResult run_udp(int connection_id);

    RunParams      params_;
    SocketFactory  udp_factory_;
    ThreadLauncher launch_;
};

} // namespace speedtest
