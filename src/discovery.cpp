/**
* @file
* @brief Offer broadcaster and listener.
*/

#include "speedtest/discovery.hpp"
#include "speedtest/errors.hpp"
#include "speedtest/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>
#include <chrono>
#include <vector>

namespace speedtest {

DiscoveryBroadcaster::DiscoveryBroadcaster(ISocket& sock, Offer offer, DiscoveryConfig cfg, ServerStats* stats)
: sock_(sock),
  msg_(encode_offer(offer.udp_port, offer.tcp_port)),
  dest_{cfg.broadcast_ip, cfg.port},
  cfg_(std::move(cfg)),
  stats_(stats) {}

bool DiscoveryBroadcaster::send_offer() {
    if (sock_.send_to(msg_.data(), msg_.size(), dest_) < 0) {
        log_error("server", "offer broadcast to " + dest_.to_string() + " failed: " + strerror(errno));
        if (stats_) stats_->inc_errors();
        return false;
    }
    if (stats_) stats_->inc_offers();
    return true;
}

void DiscoveryBroadcaster::run_broadcast_loop(const std::atomic<bool>& stop) {
    const int slice = std::max(1, cfg_.slice_ms);
    while (!stop) {
        if (send_offer())
            log_info("server", "Sent offer message on UDP port " + std::to_string(dest_.port), LogTone::Peach);

        // Sleep the interval in slices so a stop request is seen quickly.
        int waited = 0;
        while (!stop && waited < cfg_.interval_ms) {
            const int step = std::min(slice, cfg_.interval_ms - waited);
            std::this_thread::sleep_for(std::chrono::milliseconds(step));
            waited += step;
        }
    }
}

DiscoveryListener::DiscoveryListener(std::unique_ptr<ISocket> sock, DiscoveryConfig cfg)
: sock_(std::move(sock)), cfg_(std::move(cfg)) {
    sock_->bind(cfg_.port, true);
}

ServerInfo DiscoveryListener::await_offer(const std::atomic<bool>& stop) {
    std::vector<uint8_t> buf(kMaxDatagram);
    const int slice = std::max(1, cfg_.slice_ms);
    while (!stop) {
        Endpoint from;
        ssize_t r = sock_->recv_from(buf, &from, slice);
        if (r == 0) continue;
        if (r < 0) {
            if (errno == EINTR) continue;
            throw BindError(std::string("discovery receive failed: ") + strerror(errno));
        }
        Offer offer;
        DecodeError e = decode_offer(buf.data(), static_cast<size_t>(r), offer);
        if (e != DecodeError::Ok) {
            log_warn("client", "Invalid offer packet from " + from.to_string() + " (" + to_string(e) + ")");
            continue;
        }
        return ServerInfo{from.address, offer.tcp_port, offer.udp_port};
    }
    throw NoOfferReceived();
}

} // namespace speedtest
