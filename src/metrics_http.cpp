/**
* @file
* @brief Minimal `/metrics` HTTP server exposing speedtest::ServerStats.
*
* @details
*  - Binds to **127.0.0.1** only on the configured TCP port.
*  - Single-threaded accept/serve loop; one request, one response, close.
*  - `GET /metrics` gets the exposition body, any other request line a 404.
*  - The accept wait is bounded with `poll()` so @ref speedtest::MetricsHttpServer::stop
*    returns promptly.
*  - A failed bind is logged and the endpoint stays down; the server keeps running.
*/

#include "speedtest/metrics_http.hpp"
#include "speedtest/log.hpp"

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <sstream>

namespace speedtest {

MetricsHttpServer::MetricsHttpServer(const ServerStats& stats, uint16_t port)
: stats_(stats), port_(port) {}

MetricsHttpServer::~MetricsHttpServer() { stop(); }

void MetricsHttpServer::start() {
    if (port_ == 0 || th_.joinable()) return;
    running_ = true;
    th_ = std::thread(&MetricsHttpServer::run, this);
}

void MetricsHttpServer::stop() {
    if (th_.joinable()) {
        running_ = false;
        th_.join();
    }
}

std::string MetricsHttpServer::render() const {
    std::ostringstream oss;
    auto counter = [&oss](const char* name, const char* help, const char* type, uint64_t v) {
        oss << "# HELP " << name << " " << help << "\n";
        oss << "# TYPE " << name << " " << type << "\n";
        oss << name << " " << v << "\n";
    };
    counter("speedtest_offers_sent_total", "Offer broadcasts sent", "counter", stats_.offers());
    counter("speedtest_tcp_connections_total", "TCP connections accepted", "counter", stats_.tcp_connections());
    counter("speedtest_udp_requests_total", "UDP requests served", "counter", stats_.udp_requests());
    counter("speedtest_udp_segments_sent_total", "UDP payload segments sent", "counter", stats_.segments());
    counter("speedtest_datagrams_dropped_total", "Datagrams rejected by the decoder", "counter", stats_.dropped());
    counter("speedtest_errors_total", "Handler and broadcast failures", "counter", stats_.errors());
    counter("speedtest_tx_bytes_total", "Payload bytes sent", "counter", stats_.tx_bytes());
    counter("speedtest_unique_clients", "Unique client count", "gauge", stats_.unique_clients());
    return oss.str();
}

void MetricsHttpServer::run() {
    int s = ::socket(AF_INET, SOCK_STREAM, 0);
    if (s < 0) {
        log_error("metrics", std::string("socket() failed: ") + strerror(errno));
        return;
    }
    int one = 1;
    setsockopt(s, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(port_);
    if (::bind(s, (sockaddr*)&addr, sizeof(addr)) < 0 || ::listen(s, 8) < 0) {
        log_error("metrics", "cannot listen on 127.0.0.1:" + std::to_string(port_) + ": " + strerror(errno));
        ::close(s);
        return;
    }
    log_info("metrics", "Serving /metrics on 127.0.0.1:" + std::to_string(port_));
    listening_ = true;

    while (running_) {
        pollfd p{s, POLLIN, 0};
        if (::poll(&p, 1, 200) <= 0) continue;
        sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int c = ::accept(s, (sockaddr*)&peer, &plen);
        if (c < 0) continue;

        // Read the request head so closing does not reset the connection under the reply.
        timeval tv{1, 0};
        setsockopt(c, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        char req[1024];
        ssize_t n = ::recv(c, req, sizeof(req) - 1, 0);
        const std::string head = n > 0 ? std::string(req, static_cast<size_t>(n)) : std::string();

        const bool found = head.compare(0, 12, "GET /metrics") == 0;
        const std::string body = found ? render() : std::string("not found\n");
        std::ostringstream resp;
        resp << (found ? "HTTP/1.1 200 OK" : "HTTP/1.1 404 Not Found")
             << "\r\nContent-Type: text/plain\r\nContent-Length: " << body.size()
             << "\r\nConnection: close\r\n\r\n" << body;
        const auto out = resp.str();
        if (::send(c, out.data(), out.size(), MSG_NOSIGNAL) < 0)
            log_warn("metrics", std::string("send() failed: ") + strerror(errno));
        ::close(c);
    }
    listening_ = false;
    ::close(s);
}

} // namespace speedtest
