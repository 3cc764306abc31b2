#pragma once
#include <thread>
#include <atomic>
#include <cstdint>
#include <string>
#include "speedtest/stats.hpp"

/**
* @file
* @brief Minimal loopback HTTP endpoint that exposes @ref speedtest::ServerStats.
*
* @par Usage
* @code
* speedtest::ServerStats stats;
* speedtest::MetricsHttpServer http(stats, 9100);
* http.start();
* // ... scrape http://127.0.0.1:9100/metrics ...
* http.stop(); // or rely on destructor to stop and join
* @endcode
*
* @note The background thread only reads from @ref ServerStats via its lock-free
*       getters; @ref ServerStats::unique_clients() may take a short mutex.
*/

namespace speedtest {

/**
* @brief Background HTTP endpoint serving a Prometheus-style text body.
*
* One request, one response, close. Only `GET /metrics` is served; no keep-alive,
* loopback only.
*/
class MetricsHttpServer {
public:
    /**
     * @param stats Live counters; must outlive this object.
     * @param port  TCP port on 127.0.0.1 (0 disables the server).
     */
    MetricsHttpServer(const ServerStats& stats, uint16_t port);
    ~MetricsHttpServer();

    /// @brief Start the listener thread (no-op when the port is 0 or already running).
    void start();

    /// @brief Request shutdown and join the thread (idempotent).
    void stop();

    /// @brief True while the listener is bound and serving.
    bool listening() const { return listening_; }

    /// @brief Current exposition body.
    std::string render() const;

private:
    void run();

    const ServerStats& stats_;
    uint16_t           port_;
    std::thread        th_;
    std::atomic<bool>  running_{false};
    std::atomic<bool>  listening_{false};
};

} // namespace speedtest
