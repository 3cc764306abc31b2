#include <gtest/gtest.h>
#include "speedtest/report.hpp"

using namespace speedtest;

namespace {

SessionResult make(Protocol p, int id, uint64_t requested, uint64_t got, uint64_t ns) {
    SessionResult r;
    r.protocol = p;
    r.connection_id = id;
    r.requested_bytes = requested;
    r.bytes_received = got;
    r.elapsed_ns = ns;
    return r;
}

} // namespace

TEST(Report, SpeedAndRatio) {
    auto r = make(Protocol::UDP, 1, 2500, 1476, 1'000'000'000ull);
    EXPECT_DOUBLE_EQ(r.speed_bps(), 1476.0 * 8.0);
    EXPECT_NEAR(r.receipt_ratio(), 0.5904, 1e-12);
    EXPECT_DOUBLE_EQ(make(Protocol::UDP, 1, 0, 0, 1000).receipt_ratio(), 0.0);
}

TEST(Report, ElapsedFloor) {
    EXPECT_EQ(floor_elapsed(100, 100), kMinElapsedNs);
    EXPECT_EQ(floor_elapsed(200, 100), kMinElapsedNs);
    EXPECT_EQ(floor_elapsed(0, 5000), 5000u);
}

TEST(Report, TcpLine) {
    auto line = format_result(make(Protocol::TCP, 2, 1000, 1000, 500'000'000ull));
    EXPECT_EQ(line, "TCP transfer #2 finished, total time: 0.5000 seconds, total speed: 16000.00 bits/second");
}

TEST(Report, UdpLineHasPercentage) {
    auto line = format_result(make(Protocol::UDP, 1, 2500, 1476, 1'000'000'000ull));
    EXPECT_NE(line.find("UDP transfer #1 finished"), std::string::npos);
    EXPECT_NE(line.find("percentage of packets received successfully: 59.04%"), std::string::npos);
}

TEST(Report, FailedLineNamesReason) {
    auto r = make(Protocol::TCP, 4, 1000, 10, 1000);
    r.error = "transfer failed: recv() timed out";
    auto line = format_result(r);
    EXPECT_NE(line.find("TCP transfer #4 failed: transfer failed: recv() timed out"), std::string::npos);
    EXPECT_NE(line.find("received 10 of 1000 bytes"), std::string::npos);
}

TEST(Report, SummaryMeansAndTotals) {
    std::vector<SessionResult> rs = {
        make(Protocol::TCP, 1, 1000, 1000, 1'000'000'000ull), // 8000 b/s
        make(Protocol::TCP, 2, 1000, 1000, 2'000'000'000ull), // 4000 b/s
        make(Protocol::UDP, 1, 1000, 500, 1'000'000'000ull),  // 4000 b/s
    };
    auto s = summarize(rs);
    EXPECT_EQ(s.tcp.sessions, 2u);
    EXPECT_DOUBLE_EQ(s.tcp.mean_speed_bps, 6000.0);
    EXPECT_DOUBLE_EQ(s.tcp.total_seconds, 3.0);
    EXPECT_EQ(s.udp.sessions, 1u);
    EXPECT_DOUBLE_EQ(s.udp.mean_speed_bps, 4000.0);

    auto text = format_summary(s);
    EXPECT_NE(text.find("TCP is faster than UDP"), std::string::npos);
}

TEST(Report, SummaryWithOneProtocolHasNoVerdict) {
    auto text = format_summary(summarize({make(Protocol::TCP, 1, 10, 10, 1000)}));
    EXPECT_NE(text.find("TCP transfer mean speed"), std::string::npos);
    EXPECT_EQ(text.find("faster"), std::string::npos);
    EXPECT_EQ(text.find("UDP"), std::string::npos);
}

TEST(Report, ExperimentSummaryInMegabytesPerSecond) {
    // 1 MiB in 1 s and 2 MiB in 1 s.
    auto s = summarize({make(Protocol::TCP, 1, 2u << 20, 2u << 20, 1'000'000'000ull),
                        make(Protocol::UDP, 1, 1u << 20, 1u << 20, 1'000'000'000ull)});
    EXPECT_DOUBLE_EQ(to_mbytes_per_second(s.tcp.mean_speed_bps), 2.0);
    auto text = format_experiment_summary(s);
    EXPECT_NE(text.find("TCP transfer mean speed: 2.00 MB/s, total time: 1.0000 sec (1 sessions)"),
              std::string::npos);
    EXPECT_NE(text.find("UDP transfer mean speed: 1.00 MB/s"), std::string::npos);
    EXPECT_NE(text.find("TCP is faster than UDP"), std::string::npos);
}
