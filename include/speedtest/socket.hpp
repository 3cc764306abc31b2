#pragma once
#include <vector>
#include <deque>
#include <string>
#include <cstdint>
#include <mutex>
#include <utility>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include "speedtest/common.hpp"

/**
* @file
* @brief Socket abstractions: datagram port + test double, and RAII TCP wrappers.
*
* This header defines:
*  - @ref speedtest::ISocket : the datagram strategy/port interface that discovery and
*    UDP transfer logic depend on,
*  - @ref speedtest::UdpSocket : the POSIX implementation,
*  - @ref speedtest::MockSocket : an in-memory test double,
*  - @ref speedtest::TcpStream / @ref speedtest::TcpListener : move-only owners of a
*    connected stream socket and a listening socket.
*
* Every blocking call takes (or is configured with) a bounded wait so callers can
* poll a stop flag between calls.
*/

namespace speedtest {

/**
* @brief Abstract datagram socket (strategy/port).
*
* @par Thread-safety
* @ref send_to and @ref recv_from may be issued concurrently from several threads
* on the same instance. Implementations keep no shared mutable buffers; each call
* works on caller-provided memory. The server relies on this to share one UDP
* socket between the broadcaster, the dispatch loop and every UDP handler.
*/
class ISocket {
public:
    virtual ~ISocket() = default;

    /// @brief Underlying descriptor for polling, or -1 if not applicable.
    virtual int fd() const = 0;

    /**
     * @brief Bind to a local UDP port on all interfaces.
     * @param port  Port in host byte order; 0 lets the kernel choose.
     * @param reuse Enable @c SO_REUSEADDR (and @c SO_REUSEPORT where available).
     * @throws BindError on failure.
     */
    virtual void bind(uint16_t port, bool reuse) = 0;

    /// @brief Locally bound port (host byte order), 0 if unbound.
    virtual uint16_t local_port() const = 0;

    /// @brief Allow sending to broadcast addresses (@c SO_BROADCAST).
    virtual void set_broadcast(bool on) = 0;

    /**
     * @brief Send one datagram.
     * @return Bytes sent, or -1 on error (with errno set for real sockets).
     */
    virtual ssize_t send_to(const uint8_t* data, size_t len, const Endpoint& to) = 0;

    /**
     * @brief Wait up to @p timeout_ms for one datagram.
     *
     * @param buf  Pre-sized destination; longer datagrams are truncated.
     * @param from Optional out-parameter receiving the sender.
     * @return Datagram length (> 0), 0 if the wait elapsed with nothing received,
     *         or -1 on error.
     *
     * @note Zero-length datagrams are reported as 0; no message in this protocol is empty.
     */
    virtual ssize_t recv_from(std::vector<uint8_t>& buf, Endpoint* from, int timeout_ms) = 0;

    /// @brief Hint the desired receive buffer size (bytes). Default no-op.
    virtual void set_rcvbuf(int bytes);

    /// @brief Hint the desired send buffer size (bytes). Default no-op.
    virtual void set_sndbuf(int bytes);
};

/**
* @brief Non-blocking IPv4 UDP socket using @c poll + @c recvfrom / @c sendto.
*/
class UdpSocket : public ISocket {
public:
    /// @throws BindError if the socket cannot be created.
    UdpSocket();
    ~UdpSocket() override;

    UdpSocket(const UdpSocket&) = delete;
    UdpSocket& operator=(const UdpSocket&) = delete;

    int fd() const override { return sockfd_; }
    void bind(uint16_t port, bool reuse) override;
    uint16_t local_port() const override;
    void set_broadcast(bool on) override;
    ssize_t send_to(const uint8_t* data, size_t len, const Endpoint& to) override;
    ssize_t recv_from(std::vector<uint8_t>& buf, Endpoint* from, int timeout_ms) override;
    void set_rcvbuf(int bytes) override;
    void set_sndbuf(int bytes) override;

private:
    int sockfd_; ///< Underlying socket file descriptor.
};

/**
* @brief In-memory test double for @ref ISocket (no real network I/O).
*
* @details
* - @ref recv_from pops preloaded datagrams (@ref preload_recv); once the queue is
*   empty it reports an elapsed wait (0) immediately, without sleeping.
* - @ref send_to records every datagram with its destination for inspection.
* - @ref fail_sends makes every send report an error.
*
* Both queues are mutex-guarded so tests may drive it from several threads.
*/
class MockSocket : public ISocket {
public:
    int fd() const override { return -1; }
    void bind(uint16_t port, bool) override { port_ = port; }
    uint16_t local_port() const override { return port_; }
    void set_broadcast(bool) override {}
    ssize_t send_to(const uint8_t* data, size_t len, const Endpoint& to) override;
    ssize_t recv_from(std::vector<uint8_t>& buf, Endpoint* from, int timeout_ms) override;

    // ---------------------- Test hooks ----------------------

    /// @brief Enqueue a datagram to be returned by a later @ref recv_from.
    void preload_recv(const std::vector<uint8_t>& pkt, const Endpoint& from = {"127.0.0.1", 9});

    /// @brief Make subsequent sends fail (return -1) when @p on is true.
    void fail_sends(bool on);

    size_t sent_count() const;

    /// @brief Copy of every datagram "sent" so far, with its destination.
    std::vector<std::pair<std::vector<uint8_t>, Endpoint>> sent() const;

private:
    mutable std::mutex mu_;
    std::deque<std::pair<std::vector<uint8_t>, Endpoint>> rx_store_; ///< Preloaded incoming datagrams.
    std::vector<std::pair<std::vector<uint8_t>, Endpoint>> tx_store_; ///< Captured outgoing datagrams.
    bool     fail_sends_ = false;
    uint16_t port_ = 0;
};

/**
* @brief Owner of one connected TCP socket (move-only).
*
* Failures are reported as @ref SessionIOError so a session can catch them at
* its boundary.
*/
class TcpStream {
public:
    TcpStream() = default;
    explicit TcpStream(int fd) : fd_(fd) {}
    ~TcpStream() { close(); }

    TcpStream(TcpStream&& o) noexcept : fd_(o.fd_) { o.fd_ = -1; }
    TcpStream& operator=(TcpStream&& o) noexcept;
    TcpStream(const TcpStream&) = delete;
    TcpStream& operator=(const TcpStream&) = delete;

    /// @brief Blocking connect to @p to. @throws SessionIOError.
    static TcpStream connect(const Endpoint& to);

    bool valid() const { return fd_ >= 0; }
    int fd() const { return fd_; }

    /// @brief Bound every subsequent read (@c SO_RCVTIMEO); 0 disables the bound.
    void set_recv_timeout(int timeout_ms);

    /// @brief Bound every subsequent write (@c SO_SNDTIMEO); 0 disables the bound.
    void set_send_timeout(int timeout_ms);

    /**
     * @brief Write the whole buffer.
     * @throws SessionIOError on error or when the send timeout elapses with no progress.
     */
    void write_all(const uint8_t* data, size_t len);

    /**
     * @brief Read at most @p cap bytes.
     * @return Bytes read; 0 means the peer closed the connection.
     * @throws SessionIOError on error or when the receive timeout elapses.
     */
    size_t read_some(uint8_t* buf, size_t cap);

    void close();

private:
    int fd_ = -1;
};

/**
* @brief Non-blocking listening TCP socket bound on all interfaces.
*/
class TcpListener {
public:
    /**
     * @param port    Port in host byte order; 0 lets the kernel choose.
     * @param backlog @c listen() backlog.
     * @throws BindError on failure.
     */
    TcpListener(uint16_t port, int backlog);
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    int fd() const { return fd_; }
    uint16_t local_port() const;

    /**
     * @brief Accept one pending connection, if any.
     * @return true and fills @p out / @p peer when a connection was accepted;
     *         false when none is pending or accept failed transiently.
     */
    bool accept(TcpStream& out, Endpoint& peer);

private:
    int fd_;
};

} // namespace speedtest
