#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>
#include "speedtest/discovery.hpp"
#include "speedtest/metrics_http.hpp"
#include "speedtest/socket.hpp"
#include "speedtest/stats.hpp"
#include "speedtest/task_group.hpp"
#include "speedtest/tcp_transfer.hpp"
#include "speedtest/udp_transfer.hpp"

namespace speedtest {

/**
* @brief Server configuration knobs.
*
* @details Ports 0 (the default) let the kernel pick; the chosen ports are fixed
* for the lifetime of the server and advertised in every Offer.
*/
struct ServerConfig {
    uint16_t        udp_port     = 0;     ///< UDP port for Requests/Payloads (0 = ephemeral).
    uint16_t        tcp_port     = 0;     ///< TCP listen port (0 = ephemeral).
    int             backlog      = 1000;  ///< TCP listen backlog.
    int             poll_ms      = 200;   ///< Dispatch loop wait slice; bounds stop latency.
    bool            broadcast    = true;  ///< Run the Offer broadcaster.
    bool            verbose      = false; ///< Print a counters line once per second.
    uint16_t        metrics_port = 0;     ///< Loopback HTTP port for /metrics (0 = disabled).
    DiscoveryConfig discovery;            ///< Broadcast destination and interval.
    UdpSendOptions  udp;                  ///< Segment size and pacing.
    TcpServeOptions tcp;                  ///< Size-line limits.
};

/**
* @brief Throughput test server: Offer broadcaster plus TCP/UDP request dispatcher.
*
* @details
* Responsibilities:
*  - Bind the shared UDP socket (broadcast enabled) and the TCP listener at construction.
*  - Run the @ref DiscoveryBroadcaster on its own thread.
*  - Run a dispatch loop that polls both sockets; every accepted connection and
*    every valid Request is served by its own handler thread, independent of all
*    others and of the broadcaster.
*  - Maintain @ref ServerStats and optionally expose them on `/metrics`.
*
* The UDP socket is shared between the broadcaster, the dispatch loop and all UDP
* handlers; see @ref ISocket for the concurrency contract this relies on.
*/
class SpeedServer {
public:
    /**
     * @param cfg  Server configuration.
     * @param sock   Datagram socket to use; a @ref UdpSocket is created when null.
     * @param launch Starts handler threads; @ref default_launcher when null.
     * @throws BindError if either socket cannot be set up.
     */
    explicit SpeedServer(ServerConfig cfg, std::unique_ptr<ISocket> sock = nullptr,
                         ThreadLauncher launch = nullptr);
    ~SpeedServer();

    /// @brief Start broadcaster and dispatch threads (and metrics if configured).
    void start();

    /**
     * @brief Stop broadcasting and dispatching, then wait for in-flight handlers.
     *
     * Handlers are not interrupted; each finishes its own transfer first.
     */
    void stop();

    uint16_t udp_port() const { return udp_port_; }
    uint16_t tcp_port() const { return listener_.local_port(); }

    /// @brief Handler threads not yet joined.
    size_t active_handlers() const { return handlers_.size(); }

    const ServerStats& stats() const { return stats_; }

private:
    void run_loop();
    void poll_udp(int timeout_ms);
    void accept_tcp();

    ServerConfig                       cfg_;
    std::unique_ptr<ISocket>           sock_;
    TcpListener                        listener_;
    uint16_t                           udp_port_;
    ServerStats                        stats_;
    std::unique_ptr<MetricsHttpServer> metrics_;
    std::unique_ptr<DiscoveryBroadcaster> broadcaster_;
    TaskGroup                          handlers_;
    std::thread                        loop_th_;
    std::thread                        bcast_th_;
    std::atomic<bool>                  stop_{false};
};

} // namespace speedtest
