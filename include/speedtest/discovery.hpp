#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include "speedtest/common.hpp"
#include "speedtest/protocol.hpp"
#include "speedtest/socket.hpp"
#include "speedtest/stats.hpp"

/**
* @file
* @brief UDP broadcast discovery: the server announces its ports, the client waits for them.
*
* @par Stop handling
* Both loops take a caller-owned stop flag and never block longer than a short
* slice (@ref DiscoveryConfig::slice_ms) before re-checking it, so an interrupt is
* observed promptly even while idle.
*/

namespace speedtest {

struct DiscoveryConfig {
    uint16_t    port         = kDiscoveryPort;    ///< Well-known discovery port.
    std::string broadcast_ip = "255.255.255.255"; ///< Destination of Offer datagrams.
    int         interval_ms  = 1000;              ///< Gap between two Offers.
    int         slice_ms     = 100;               ///< Longest uninterrupted wait.
};

/// @brief Where a discovered server can be reached.
struct ServerInfo {
    std::string address;
    uint16_t    tcp_port = 0;
    uint16_t    udp_port = 0;

    Endpoint tcp() const { return Endpoint{address, tcp_port}; }
    Endpoint udp() const { return Endpoint{address, udp_port}; }
};

/**
* @brief Periodically sends an Offer carrying the server's UDP and TCP ports.
*
* The socket is borrowed (the server shares it with its request loop and UDP
* handlers) and must have broadcast enabled when @ref DiscoveryConfig::broadcast_ip
* is a broadcast address.
*/
class DiscoveryBroadcaster {
public:
    DiscoveryBroadcaster(ISocket& sock, Offer offer, DiscoveryConfig cfg, ServerStats* stats = nullptr);

    /**
     * @brief Send one Offer per interval until @p stop becomes true.
     *
     * Send failures are logged and the loop carries on; broadcasting is best-effort.
     */
    void run_broadcast_loop(const std::atomic<bool>& stop);

    /// @brief Send a single Offer. @return false if the socket rejected it.
    bool send_offer();

private:
    ISocket&             sock_;
    std::vector<uint8_t> msg_;   ///< Pre-encoded Offer, immutable after construction.
    Endpoint             dest_;
    DiscoveryConfig      cfg_;
    ServerStats*         stats_;
};

/**
* @brief Client side: bind the discovery port and wait for the first valid Offer.
*/
class DiscoveryListener {
public:
    /**
     * @brief Take ownership of @p sock and bind it to @ref DiscoveryConfig::port with reuse.
     * @throws BindError if the port cannot be bound.
     */
    DiscoveryListener(std::unique_ptr<ISocket> sock, DiscoveryConfig cfg);

    /**
     * @brief Block until an Offer decodes successfully.
     *
     * Foreign or malformed datagrams are logged and skipped.
     *
     * @return Sender address plus the advertised TCP/UDP ports.
     * @throws NoOfferReceived if @p stop is raised first.
     * @throws BindError if the socket reports an unrecoverable receive error.
     */
    ServerInfo await_offer(const std::atomic<bool>& stop);

private:
    std::unique_ptr<ISocket> sock_;
    DiscoveryConfig          cfg_;
};

} // namespace speedtest
