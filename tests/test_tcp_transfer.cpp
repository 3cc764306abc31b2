#include <gtest/gtest.h>
#include "speedtest/errors.hpp"
#include "speedtest/server.hpp"
#include "speedtest/tcp_transfer.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <string>
#include <thread>

using namespace speedtest;

namespace {

ServerConfig loopback_config() {
    ServerConfig cfg;
    cfg.broadcast = false;
    return cfg;
}

TcpSessionParams params_for(uint16_t port, uint64_t size, int id = 1) {
    TcpSessionParams p;
    p.server = Endpoint{"127.0.0.1", port};
    p.file_size = size;
    p.connection_id = id;
    p.read_timeout_ms = 5000;
    return p;
}

// Read until EOF or reset; returns the byte count.
size_t drain(TcpStream& s) {
    uint8_t buf[4096];
    size_t total = 0;
    try {
        for (;;) {
            size_t n = s.read_some(buf, sizeof(buf));
            if (n == 0) return total;
            total += n;
        }
    } catch (const SessionIOError&) {
        return total; // closing with unread input resets the connection
    }
}

bool wait_until(const std::function<bool()>& pred, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

} // namespace

TEST(TcpSession, ReceivesExactSize) {
    SpeedServer server(loopback_config());
    server.start();
    const uint64_t sizes[] = {1, 1000, 1024, 65536, 1 << 20};
    for (uint64_t size : sizes) {
        auto res = run_tcp_session(params_for(server.tcp_port(), size));
        EXPECT_TRUE(res.ok()) << res.error;
        EXPECT_EQ(res.protocol, Protocol::TCP);
        EXPECT_EQ(res.bytes_received, size);
        EXPECT_GT(res.elapsed_ns, 0u);
        EXPECT_GT(res.speed_bps(), 0.0);
    }
    server.stop();
    EXPECT_EQ(server.stats().tcp_connections(), 5u);
}

TEST(TcpSession, ZeroSizeCompletesImmediately) {
    SpeedServer server(loopback_config());
    server.start();
    auto res = run_tcp_session(params_for(server.tcp_port(), 0));
    server.stop();
    EXPECT_TRUE(res.ok()) << res.error;
    EXPECT_EQ(res.bytes_received, 0u);
    EXPECT_GE(res.elapsed_ns, kMinElapsedNs);
}

TEST(TcpSession, RefusedConnectionIsReported) {
    uint16_t port = 0;
    {
        TcpListener scratch(0, 1);
        port = scratch.local_port();
    } // closed: nothing listens there now
    auto res = run_tcp_session(params_for(port, 1024, 3));
    EXPECT_FALSE(res.ok());
    EXPECT_EQ(res.connection_id, 3);
    EXPECT_EQ(res.bytes_received, 0u);
}

TEST(TcpServe, RejectsMalformedSizeLine) {
    SpeedServer server(loopback_config());
    server.start();

    auto s = TcpStream::connect(Endpoint{"127.0.0.1", server.tcp_port()});
    s.set_recv_timeout(5000);
    const std::string line = "12x4\n";
    s.write_all(reinterpret_cast<const uint8_t*>(line.data()), line.size());
    EXPECT_EQ(drain(s), 0u);

    server.stop();
    EXPECT_EQ(server.stats().errors(), 1u);
    EXPECT_EQ(server.stats().tx_bytes(), 0u);
}

TEST(TcpServe, RejectsOversizedLine) {
    SpeedServer server(loopback_config());
    server.start();

    auto s = TcpStream::connect(Endpoint{"127.0.0.1", server.tcp_port()});
    s.set_recv_timeout(5000);
    const std::string line(64, '1');
    s.write_all(reinterpret_cast<const uint8_t*>(line.data()), line.size());
    EXPECT_EQ(drain(s), 0u);

    server.stop();
    EXPECT_EQ(server.stats().errors(), 1u);
}

TEST(TcpServe, AcceptsCarriageReturn) {
    SpeedServer server(loopback_config());
    server.start();

    auto s = TcpStream::connect(Endpoint{"127.0.0.1", server.tcp_port()});
    s.set_recv_timeout(5000);
    const std::string line = "3000\r\n";
    s.write_all(reinterpret_cast<const uint8_t*>(line.data()), line.size());
    EXPECT_EQ(drain(s), 3000u);
    server.stop();
}

TEST(TcpServe, ClientGoneBeforeAnnouncement) {
    SpeedServer server(loopback_config());
    server.start();
    {
        auto s = TcpStream::connect(Endpoint{"127.0.0.1", server.tcp_port()});
        ASSERT_TRUE(wait_until([&] { return server.stats().tcp_connections() == 1; }));
    }
    server.stop();
    EXPECT_EQ(server.stats().tcp_connections(), 1u);
    EXPECT_EQ(server.stats().errors(), 1u);
}

TEST(TcpServe, StalledReaderIsDroppedAndStopReturns) {
    ServerConfig cfg = loopback_config();
    cfg.tcp.write_timeout_ms = 300;
    SpeedServer server(cfg);
    server.start();

    auto s = TcpStream::connect(Endpoint{"127.0.0.1", server.tcp_port()});
    const std::string line = "1000000000\n";
    s.write_all(reinterpret_cast<const uint8_t*>(line.data()), line.size());
    // Never read: the server's send buffer fills and its write stalls.
    EXPECT_TRUE(wait_until([&] { return server.stats().errors() == 1; }, 10000));

    auto stopped = std::async(std::launch::async, [&] { server.stop(); });
    ASSERT_EQ(stopped.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_EQ(server.active_handlers(), 0u);
    EXPECT_LT(server.stats().tx_bytes(), 1000000000u);
}

TEST(TcpStreamTest, ConnectToBadAddressThrows) {
    EXPECT_THROW(TcpStream::connect(Endpoint{"not-an-ip", 80}), SessionIOError);
}
