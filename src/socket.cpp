/**
* @file
* @brief POSIX/Linux socket implementations: UdpSocket, MockSocket, TcpStream, TcpListener.
*
* @details
*  - `UdpSocket` is created non-blocking; waits are done with `poll()` so every
*    receive is bounded by the caller's timeout. Transient `EAGAIN` on send is
*    retried once after waiting for writability.
*  - `TcpStream` sends with `MSG_NOSIGNAL` so a vanished peer surfaces as an
*    error instead of `SIGPIPE`.
*  - `TcpListener` is non-blocking; the dispatcher polls it before accepting.
*/

#include "speedtest/socket.hpp"
#include "speedtest/errors.hpp"

#include <arpa/inet.h>
#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <cerrno>
#include <sys/types.h>
#include <sys/time.h>
#include <fcntl.h>
#include <poll.h>

namespace speedtest {

sockaddr_in Endpoint::to_sockaddr() const {
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    if (inet_pton(AF_INET, address.c_str(), &sa.sin_addr) != 1)
        throw std::invalid_argument("invalid IPv4 address: " + address);
    return sa;
}

Endpoint Endpoint::from_sockaddr(const sockaddr_in& sa) {
    char text[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &sa.sin_addr, text, sizeof(text));
    return Endpoint{text, ntohs(sa.sin_port)};
}

void ISocket::set_rcvbuf(int bytes) {
    (void)bytes; // default no-op; concrete implementations may override
}

void ISocket::set_sndbuf(int bytes) {
    (void)bytes; // default no-op; concrete implementations may override
}

/// \cond INTERNAL
namespace {

std::string errno_text(const char* what) {
    return std::string(what) + ": " + strerror(errno);
}

void set_non_blocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0)
        throw BindError(errno_text("fcntl(O_NONBLOCK) failed"));
}

void enable_reuse(int fd) {
    int one = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
#ifdef SO_REUSEPORT
    setsockopt(fd, SOL_SOCKET, SO_REUSEPORT, &one, sizeof(one));
#endif
}

uint16_t bound_port(int fd) {
    sockaddr_in sa{};
    socklen_t len = sizeof(sa);
    if (::getsockname(fd, (sockaddr*)&sa, &len) < 0) return 0;
    return ntohs(sa.sin_port);
}

// Wait for @p events on @p fd. Returns >0 ready, 0 elapsed, -1 error.
int wait_for(int fd, short events, int timeout_ms) {
    pollfd p{fd, events, 0};
    for (;;) {
        int r = ::poll(&p, 1, timeout_ms);
        if (r < 0 && errno == EINTR) continue;
        return r;
    }
}

} // namespace
/// \endcond

UdpSocket::UdpSocket() : sockfd_(::socket(AF_INET, SOCK_DGRAM, 0)) {
    if (sockfd_ < 0) throw BindError(errno_text("socket() failed"));
    try {
        set_non_blocking(sockfd_);
    } catch (...) {
        ::close(sockfd_);
        throw;
    }
}

UdpSocket::~UdpSocket() {
    if (sockfd_ >= 0) ::close(sockfd_);
}

void UdpSocket::bind(uint16_t port, bool reuse) {
    if (reuse) enable_reuse(sockfd_);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = htons(port);
    if (::bind(sockfd_, (sockaddr*)&addr, sizeof(addr)) < 0)
        throw BindError(errno_text(("bind(udp " + std::to_string(port) + ") failed").c_str()));
}

uint16_t UdpSocket::local_port() const { return bound_port(sockfd_); }

void UdpSocket::set_broadcast(bool on) {
    int v = on ? 1 : 0;
    if (setsockopt(sockfd_, SOL_SOCKET, SO_BROADCAST, &v, sizeof(v)) < 0)
        throw BindError(errno_text("setsockopt(SO_BROADCAST) failed"));
}

ssize_t UdpSocket::send_to(const uint8_t* data, size_t len, const Endpoint& to) {
    sockaddr_in sa{};
    try {
        sa = to.to_sockaddr();
    } catch (const std::invalid_argument&) {
        errno = EINVAL;
        return -1;
    }
    for (int attempt = 0; attempt < 2; ++attempt) {
        ssize_t r = ::sendto(sockfd_, data, len, 0, (sockaddr*)&sa, sizeof(sa));
        if (r >= 0) return r;
        if (errno != EAGAIN && errno != EWOULDBLOCK) return -1;
        // Send buffer full: wait briefly for room, then retry once.
        if (wait_for(sockfd_, POLLOUT, 100) <= 0) break;
    }
    return -1;
}

ssize_t UdpSocket::recv_from(std::vector<uint8_t>& buf, Endpoint* from, int timeout_ms) {
    int ready = wait_for(sockfd_, POLLIN, timeout_ms);
    if (ready < 0) return -1;
    if (ready == 0) return 0;
    sockaddr_in addr{};
    socklen_t alen = sizeof(addr);
    ssize_t r = ::recvfrom(sockfd_, buf.data(), buf.size(), 0, (sockaddr*)&addr, &alen);
    if (r < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return 0;
    if (r < 0) return -1;
    if (from) *from = Endpoint::from_sockaddr(addr);
    return r;
}

void UdpSocket::set_rcvbuf(int bytes) {
    setsockopt(sockfd_, SOL_SOCKET, SO_RCVBUF, &bytes, sizeof(bytes));
}

void UdpSocket::set_sndbuf(int bytes) {
    setsockopt(sockfd_, SOL_SOCKET, SO_SNDBUF, &bytes, sizeof(bytes));
}

ssize_t MockSocket::send_to(const uint8_t* data, size_t len, const Endpoint& to) {
    std::lock_guard<std::mutex> lg(mu_);
    if (fail_sends_) {
        errno = EIO;
        return -1;
    }
    tx_store_.emplace_back(std::vector<uint8_t>(data, data + len), to);
    return static_cast<ssize_t>(len);
}

ssize_t MockSocket::recv_from(std::vector<uint8_t>& buf, Endpoint* from, int) {
    std::lock_guard<std::mutex> lg(mu_);
    if (rx_store_.empty()) return 0;
    auto pkt = std::move(rx_store_.front());
    rx_store_.pop_front();
    size_t n = std::min(buf.size(), pkt.first.size());
    std::copy(pkt.first.begin(), pkt.first.begin() + n, buf.begin());
    if (from) *from = pkt.second;
    return static_cast<ssize_t>(n);
}

void MockSocket::preload_recv(const std::vector<uint8_t>& pkt, const Endpoint& from) {
    std::lock_guard<std::mutex> lg(mu_);
    rx_store_.emplace_back(pkt, from);
}

void MockSocket::fail_sends(bool on) {
    std::lock_guard<std::mutex> lg(mu_);
    fail_sends_ = on;
}

size_t MockSocket::sent_count() const {
    std::lock_guard<std::mutex> lg(mu_);
    return tx_store_.size();
}

std::vector<std::pair<std::vector<uint8_t>, Endpoint>> MockSocket::sent() const {
    std::lock_guard<std::mutex> lg(mu_);
    return tx_store_;
}

TcpStream& TcpStream::operator=(TcpStream&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = -1;
    }
    return *this;
}

TcpStream TcpStream::connect(const Endpoint& to) {
    sockaddr_in sa{};
    try {
        sa = to.to_sockaddr();
    } catch (const std::invalid_argument& e) {
        throw SessionIOError(e.what());
    }
    int s = ::socket(AF_INET, SOCK_STREAM, 0);
    if (s < 0) throw SessionIOError(errno_text("socket() failed"));
    TcpStream stream(s);
    if (::connect(s, (sockaddr*)&sa, sizeof(sa)) < 0)
        throw SessionIOError(errno_text(("connect(" + to.to_string() + ") failed").c_str()));
    return stream;
}

void TcpStream::set_recv_timeout(int timeout_ms) {
    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

void TcpStream::set_send_timeout(int timeout_ms) {
    timeval tv{};
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

void TcpStream::write_all(const uint8_t* data, size_t len) {
    size_t off = 0;
    while (off < len) {
        ssize_t w = ::send(fd_, data + off, len - off, MSG_NOSIGNAL);
        if (w < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) throw SessionIOError("send() timed out");
            throw SessionIOError(errno_text("send() failed"));
        }
        off += static_cast<size_t>(w);
    }
}

size_t TcpStream::read_some(uint8_t* buf, size_t cap) {
    for (;;) {
        ssize_t r = ::recv(fd_, buf, cap, 0);
        if (r >= 0) return static_cast<size_t>(r);
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) throw SessionIOError("recv() timed out");
        throw SessionIOError(errno_text("recv() failed"));
    }
}

void TcpStream::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

TcpListener::TcpListener(uint16_t port, int backlog) : fd_(::socket(AF_INET, SOCK_STREAM, 0)) {
    if (fd_ < 0) throw BindError(errno_text("socket() failed"));
    try {
        enable_reuse(fd_);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(port);
        if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) < 0)
            throw BindError(errno_text(("bind(tcp " + std::to_string(port) + ") failed").c_str()));
        if (::listen(fd_, backlog) < 0)
            throw BindError(errno_text("listen() failed"));
        set_non_blocking(fd_);
    } catch (...) {
        ::close(fd_);
        throw;
    }
}

TcpListener::~TcpListener() {
    if (fd_ >= 0) ::close(fd_);
}

uint16_t TcpListener::local_port() const { return bound_port(fd_); }

bool TcpListener::accept(TcpStream& out, Endpoint& peer) {
    sockaddr_in addr{};
    socklen_t alen = sizeof(addr);
    int c = ::accept(fd_, (sockaddr*)&addr, &alen);
    if (c < 0) return false;
    out = TcpStream(c);
    peer = Endpoint::from_sockaddr(addr);
    return true;
}

} // namespace speedtest
