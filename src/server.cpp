/**
* @file
* @brief SpeedServer implementation: broadcaster thread, dispatch loop, handler threads.
*
* @details
* Dispatch loop:
*  - `poll()` on the UDP socket and the TCP listener with a bounded wait
*    (@ref speedtest::ServerConfig::poll_ms) so a stop request is noticed promptly.
*  - A readable UDP socket yields one datagram; a valid Request spawns a UDP
*    handler, anything else is counted as dropped and logged.
*  - A readable listener is drained with non-blocking `accept()`; each connection
*    spawns a TCP handler.
*  - Finished handler threads are reaped every iteration.
*
* Sockets without a descriptor (@ref speedtest::MockSocket returns -1) are polled by
* calling `recv_from` with a zero wait on every iteration instead.
*/

#include "speedtest/server.hpp"
#include "speedtest/log.hpp"
#include "speedtest/protocol.hpp"

#include <arpa/inet.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <vector>

namespace speedtest {

/// \cond INTERNAL
namespace {

uint16_t bind_udp(ISocket& sock, const ServerConfig& cfg) {
    sock.bind(cfg.udp_port, true);
    sock.set_broadcast(true);
    sock.set_rcvbuf(1 << 20);
    sock.set_sndbuf(1 << 20);
    return sock.local_port();
}

std::unique_ptr<ISocket> default_socket(std::unique_ptr<ISocket> sock) {
    if (sock) return sock;
    return std::make_unique<UdpSocket>();
}

uint32_t host_order_addr(const std::string& dotted) {
    in_addr a{};
    if (inet_pton(AF_INET, dotted.c_str(), &a) != 1) return 0;
    return ntohl(a.s_addr);
}

} // namespace
/// \endcond

SpeedServer::SpeedServer(ServerConfig cfg, std::unique_ptr<ISocket> sock, ThreadLauncher launch)
: cfg_(std::move(cfg)),
  sock_(default_socket(std::move(sock))),
  listener_(cfg_.tcp_port, cfg_.backlog),
  udp_port_(bind_udp(*sock_, cfg_)),
  handlers_(std::move(launch)) {
    if (cfg_.broadcast) {
        broadcaster_ = std::make_unique<DiscoveryBroadcaster>(
            *sock_, Offer{udp_port_, listener_.local_port()}, cfg_.discovery, &stats_);
    }
    if (cfg_.metrics_port) {
        metrics_ = std::make_unique<MetricsHttpServer>(stats_, cfg_.metrics_port);
    }
    log_info("server", "Listening on UDP port " + std::to_string(udp_port_) +
             " and TCP port " + std::to_string(listener_.local_port()), LogTone::Peach);
}

SpeedServer::~SpeedServer() {
    stop();
}

void SpeedServer::start() {
    if (loop_th_.joinable()) return;
    if (metrics_) metrics_->start();
    stop_ = false;
    if (broadcaster_) bcast_th_ = std::thread([this] { broadcaster_->run_broadcast_loop(stop_); });
    loop_th_ = std::thread(&SpeedServer::run_loop, this);
}

void SpeedServer::stop() {
    stop_ = true;
    if (bcast_th_.joinable()) bcast_th_.join();
    if (loop_th_.joinable()) loop_th_.join();
    handlers_.join_all();
    if (metrics_) metrics_->stop();
}

void SpeedServer::poll_udp(int timeout_ms) {
    std::vector<uint8_t> buf(kMaxDatagram);
    Endpoint from;
    ssize_t r = sock_->recv_from(buf, &from, timeout_ms);
    if (r <= 0) return;

    Request req;
    DecodeError e = decode_request(buf.data(), static_cast<size_t>(r), req);
    if (e != DecodeError::Ok) {
        stats_.inc_dropped();
        log_warn("server", "Dropped datagram from " + from.to_string() + " (" + to_string(e) + ")");
        return;
    }

    stats_.inc_udp_requests();
    stats_.note_client(host_order_addr(from.address), from.port);
    log_info("server", "Sending UDP data (" + std::to_string(req.file_size) + " bytes) to " +
             from.to_string(), LogTone::Blue);

    ISocket& sock = *sock_;
    const UdpSendOptions opts = cfg_.udp;
    const uint64_t size = req.file_size;
    const bool started = handlers_.spawn([this, &sock, from, size, opts] {
        serve_udp_request(sock, from, size, opts, stats_);
    });
    if (!started) {
        stats_.inc_errors();
        log_warn("server", "Request from " + from.to_string() + " not served: no handler thread");
    }
}

void SpeedServer::accept_tcp() {
    for (;;) {
        TcpStream conn;
        Endpoint peer;
        if (!listener_.accept(conn, peer)) return;

        stats_.inc_tcp_connections();
        stats_.note_client(host_order_addr(peer.address), peer.port);
        log_info("server", "TCP Connection accepted from " + peer.to_string(), LogTone::Lavender);

        // std::function needs a copyable callable; the stream travels in a shared_ptr.
        auto stream = std::make_shared<TcpStream>(std::move(conn));
        const TcpServeOptions opts = cfg_.tcp;
        const bool started = handlers_.spawn([this, stream, peer, opts] {
            serve_tcp_connection(std::move(*stream), peer, opts, stats_);
        });
        if (!started) {
            // The discarded handler owned the last reference; the connection is closed.
            stats_.inc_errors();
            log_warn("server", "Connection from " + peer.to_string() + " dropped: no handler thread");
        }
    }
}

void SpeedServer::run_loop() {
    auto last_ts = std::chrono::steady_clock::now();
    const int udp_fd = sock_->fd();

    while (!stop_) {
        pollfd fds[2] = {
            {listener_.fd(), POLLIN, 0},
            {udp_fd, POLLIN, 0}, // negative fd is ignored by poll()
        };
        int r = ::poll(fds, 2, cfg_.poll_ms);
        if (r < 0 && errno != EINTR) {
            log_error("server", std::string("poll() failed: ") + strerror(errno));
            stats_.inc_errors();
        }
        if (r > 0 && (fds[0].revents & POLLIN)) accept_tcp();
        if (udp_fd < 0) poll_udp(0);
        else if (r > 0 && (fds[1].revents & POLLIN)) poll_udp(0);

        handlers_.reap();

        // Once per second: counters line.
        auto now = std::chrono::steady_clock::now();
        if (now - last_ts >= std::chrono::seconds(1)) {
            if (cfg_.verbose) {
                log_info("server", stats_.to_string() + " active_handlers=" +
                         std::to_string(handlers_.size()));
            }
            last_ts = now;
        }
    }
}

} // namespace speedtest
