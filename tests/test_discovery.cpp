#include <gtest/gtest.h>
#include "speedtest/discovery.hpp"
#include "speedtest/errors.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace speedtest;

namespace {

DiscoveryConfig fast_config(uint16_t port) {
    DiscoveryConfig cfg;
    cfg.port = port;
    cfg.broadcast_ip = "127.0.0.1";
    cfg.interval_ms = 20;
    cfg.slice_ms = 10;
    return cfg;
}

} // namespace

TEST(Broadcaster, SendsOffersUntilStopped) {
    MockSocket sock;
    ServerStats stats;
    DiscoveryBroadcaster b(sock, Offer{4001, 4002}, fast_config(54391), &stats);

    std::atomic<bool> stop{false};
    std::thread th([&] { b.run_broadcast_loop(stop); });
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    stop = true;
    th.join();

    auto sent = sock.sent();
    ASSERT_GE(sent.size(), 2u);
    for (auto& s : sent) {
        EXPECT_EQ(s.second, (Endpoint{"127.0.0.1", 54391}));
        Offer o;
        ASSERT_EQ(decode_offer(s.first.data(), s.first.size(), o), DecodeError::Ok);
        EXPECT_EQ(o, (Offer{4001, 4002}));
    }
    EXPECT_EQ(stats.offers(), sent.size());
}

TEST(Broadcaster, SendFailureDoesNotEndLoop) {
    MockSocket sock;
    sock.fail_sends(true);
    ServerStats stats;
    DiscoveryBroadcaster b(sock, Offer{1, 2}, fast_config(54391), &stats);

    std::atomic<bool> stop{false};
    std::thread th([&] { b.run_broadcast_loop(stop); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    stop = true;
    th.join();

    EXPECT_GE(stats.errors(), 2u);
    EXPECT_EQ(stats.offers(), 0u);
}

TEST(Broadcaster, StopIsObservedWithinOneSlice) {
    MockSocket sock;
    DiscoveryConfig cfg = fast_config(54391);
    cfg.interval_ms = 60000;
    cfg.slice_ms = 50;
    DiscoveryBroadcaster b(sock, Offer{1, 2}, cfg);

    std::atomic<bool> stop{false};
    std::thread th([&] { b.run_broadcast_loop(stop); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto t0 = std::chrono::steady_clock::now();
    stop = true;
    th.join();
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::milliseconds(500));
    EXPECT_EQ(sock.sent_count(), 1u);
}

TEST(Listener, SkipsMalformedDatagrams) {
    auto mock = std::make_unique<MockSocket>();
    mock->preload_recv({0xAB, 0xCD}, Endpoint{"10.0.0.1", 1});
    mock->preload_recv(encode_request(5), Endpoint{"10.0.0.2", 2});
    auto foreign = encode_offer(7, 8);
    foreign[3] = 0x00;
    mock->preload_recv(foreign, Endpoint{"10.0.0.3", 3});
    mock->preload_recv(encode_offer(6000, 7000), Endpoint{"10.0.0.4", 4});

    DiscoveryListener listener(std::move(mock), fast_config(54391));
    std::atomic<bool> stop{false};
    ServerInfo info = listener.await_offer(stop);
    EXPECT_EQ(info.address, "10.0.0.4");
    EXPECT_EQ(info.udp_port, 6000);
    EXPECT_EQ(info.tcp_port, 7000);
    EXPECT_EQ(info.tcp(), (Endpoint{"10.0.0.4", 7000}));
    EXPECT_EQ(info.udp(), (Endpoint{"10.0.0.4", 6000}));
}

TEST(Listener, RaisedStopYieldsNoOffer) {
    DiscoveryListener listener(std::make_unique<MockSocket>(), fast_config(54391));
    std::atomic<bool> stop{true};
    EXPECT_THROW(listener.await_offer(stop), NoOfferReceived);
}

TEST(Listener, BlockedWaitReturnsPromptlyOnStop) {
    DiscoveryConfig cfg = fast_config(54392);
    cfg.slice_ms = 200;
    DiscoveryListener listener(std::make_unique<UdpSocket>(), cfg);

    std::atomic<bool> stop{false};
    std::thread stopper([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        stop = true;
    });
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_THROW(listener.await_offer(stop), NoOfferReceived);
    auto waited = std::chrono::steady_clock::now() - t0;
    stopper.join();
    EXPECT_LT(waited, std::chrono::milliseconds(1000));
}

TEST(Discovery, BroadcasterReachesListenerOverLoopback) {
    const uint16_t port = 54393;
    DiscoveryListener listener(std::make_unique<UdpSocket>(), fast_config(port));

    UdpSocket server_sock;
    server_sock.bind(0, true);
    DiscoveryBroadcaster b(server_sock, Offer{1111, 2222}, fast_config(port));

    std::atomic<bool> stop_bcast{false};
    std::thread th([&] { b.run_broadcast_loop(stop_bcast); });

    std::atomic<bool> stop_listen{false};
    std::thread guard([&] {
        // Give up after 3 s so a missing offer fails instead of hanging.
        for (int i = 0; i < 300 && !stop_bcast; ++i)
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        stop_listen = true;
    });
    ServerInfo info;
    EXPECT_NO_THROW(info = listener.await_offer(stop_listen));
    stop_bcast = true;
    stop_listen = true;
    th.join();
    guard.join();

    EXPECT_EQ(info.address, "127.0.0.1");
    EXPECT_EQ(info.udp_port, 1111);
    EXPECT_EQ(info.tcp_port, 2222);
}

TEST(Listener, PortAlreadyExclusivelyBoundFails) {
    // A socket bound without reuse blocks the listener's bind.
    UdpSocket holder;
    holder.bind(0, false);
    DiscoveryConfig cfg = fast_config(holder.local_port());
    EXPECT_THROW(DiscoveryListener l(std::make_unique<UdpSocket>(), cfg), BindError);
}
