#pragma once
#include <atomic>
#include <cstdint>
#include <unordered_map>
#include <mutex>
#include <string>
#include <sstream>

/**
* @file
* @brief Lightweight, thread-safe server counters and client tracking.
*
* This header exposes:
*  - @ref speedtest::ClientKey : a compact (IPv4 address, port) tuple with equality.
*  - @ref speedtest::ClientKeyHash : hash functor for @c unordered_map keys.
*  - @ref speedtest::ServerStats : hot-path counters (lock-free atomics) bumped by the
*    broadcaster, the dispatch loop and every handler thread, plus a unique-client
*    tracker guarded by a short-lived mutex.
*
* @note The atomic counters use @c memory_order_relaxed because we only care about
*       numerical accuracy, not cross-counter ordering.
*/

namespace speedtest {

/**
* @brief Key type representing a client as (IPv4 address, port), host byte order.
*/
struct ClientKey {
    uint32_t addr;  ///< IPv4 address (host order).
    uint16_t port;  ///< Port (host order).

    bool operator==(const ClientKey& o) const { return addr == o.addr && port == o.port; }
};

/// @brief Cheap mix of address and port for @c std::unordered_map.
struct ClientKeyHash {
    size_t operator()(const ClientKey& k) const {
        return (static_cast<size_t>(k.addr) << 16) ^ k.port;
    }
};

/**
* @brief Aggregated server counters.
*
* @par Thread-safety
* All increments and getters are lock-free; @ref note_client and
* @ref unique_clients acquire an internal mutex. A @ref to_string line is not a
* transactional snapshot across counters.
*/
class ServerStats {
public:
    void inc_offers(uint64_t n = 1)          { offers_.fetch_add(n, std::memory_order_relaxed); }
    void inc_tcp_connections(uint64_t n = 1) { tcp_conns_.fetch_add(n, std::memory_order_relaxed); }
    void inc_udp_requests(uint64_t n = 1)    { udp_reqs_.fetch_add(n, std::memory_order_relaxed); }
    void inc_segments(uint64_t n = 1)        { segments_.fetch_add(n, std::memory_order_relaxed); }
    void inc_dropped(uint64_t n = 1)         { dropped_.fetch_add(n, std::memory_order_relaxed); }
    void inc_errors(uint64_t n = 1)          { errors_.fetch_add(n, std::memory_order_relaxed); }
    void add_tx_bytes(uint64_t n)            { tx_bytes_.fetch_add(n, std::memory_order_relaxed); }

    /// @brief Record activity for a client (addr, port in host order).
    void note_client(uint32_t addr, uint16_t port) {
        std::lock_guard<std::mutex> lg(mu_);
        clients_[ClientKey{addr, port}]++;
    }

    size_t unique_clients() const {
        std::lock_guard<std::mutex> lg(mu_);
        return clients_.size();
    }

    uint64_t offers() const          { return offers_.load(std::memory_order_relaxed); }
    uint64_t tcp_connections() const { return tcp_conns_.load(std::memory_order_relaxed); }
    uint64_t udp_requests() const    { return udp_reqs_.load(std::memory_order_relaxed); }
    uint64_t segments() const        { return segments_.load(std::memory_order_relaxed); }
    uint64_t dropped() const         { return dropped_.load(std::memory_order_relaxed); }
    uint64_t errors() const          { return errors_.load(std::memory_order_relaxed); }
    uint64_t tx_bytes() const        { return tx_bytes_.load(std::memory_order_relaxed); }

    /// @brief Single-line snapshot for the periodic verbose log.
    std::string to_string() const {
        std::ostringstream oss;
        oss << "offers=" << offers() << " tcp=" << tcp_connections()
            << " udp=" << udp_requests() << " segments=" << segments()
            << " dropped=" << dropped() << " errors=" << errors()
            << " unique_clients=" << unique_clients() << " tx_bytes=" << tx_bytes();
        return oss.str();
    }

private:
    /// @name Hot-path counters (lock-free)
    ///@{
    std::atomic<uint64_t> offers_{0};    ///< Offer broadcasts sent.
    std::atomic<uint64_t> tcp_conns_{0}; ///< TCP connections accepted.
    std::atomic<uint64_t> udp_reqs_{0};  ///< Valid UDP Requests dispatched.
    std::atomic<uint64_t> segments_{0};  ///< Payload datagrams sent.
    std::atomic<uint64_t> dropped_{0};   ///< Datagrams rejected by the decoder.
    std::atomic<uint64_t> errors_{0};    ///< Handler or broadcast failures.
    std::atomic<uint64_t> tx_bytes_{0};  ///< Filler bytes written (TCP + UDP data).
    ///@}

    mutable std::mutex mu_;  ///< Protects @ref clients_.
    std::unordered_map<ClientKey, uint64_t, ClientKeyHash> clients_;
};

} // namespace speedtest
