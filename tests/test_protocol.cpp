#include <gtest/gtest.h>
#include "speedtest/protocol.hpp"

#include <algorithm>
#include <limits>

using namespace speedtest;

TEST(Protocol, OfferLayoutIsBigEndian) {
    auto b = encode_offer(0x1234, 0xBEEF);
    ASSERT_EQ(b.size(), kOfferSize);
    const std::vector<uint8_t> want = {0xAB, 0xCD, 0xDC, 0xBA, 0x02, 0x12, 0x34, 0xBE, 0xEF};
    EXPECT_EQ(b, want);
}

TEST(Protocol, OfferRoundTrip) {
    const uint16_t ports[] = {0, 1, 8080, 54321, 65535};
    for (uint16_t u : ports) {
        for (uint16_t t : ports) {
            auto b = encode_offer(u, t);
            Offer o;
            ASSERT_EQ(decode_offer(b.data(), b.size(), o), DecodeError::Ok);
            EXPECT_EQ(o, (Offer{u, t}));
        }
    }
}

TEST(Protocol, RequestRoundTrip) {
    const uint64_t sizes[] = {0, 1, 1024, 2500, 1ull << 40, std::numeric_limits<uint64_t>::max()};
    for (uint64_t s : sizes) {
        auto b = encode_request(s);
        ASSERT_EQ(b.size(), kRequestSize);
        Request r;
        ASSERT_EQ(decode_request(b.data(), b.size(), r), DecodeError::Ok);
        EXPECT_EQ(r.file_size, s);
    }
}

TEST(Protocol, PayloadRoundTripReferencesInput) {
    std::vector<uint8_t> data(452);
    for (size_t i = 0; i < data.size(); ++i) data[i] = static_cast<uint8_t>(i * 7);
    auto b = encode_payload(3, 2, data.data(), data.size());
    ASSERT_EQ(b.size(), kPayloadHeaderSize + data.size());

    PayloadView v;
    ASSERT_EQ(decode_payload(b.data(), b.size(), v), DecodeError::Ok);
    EXPECT_EQ(v.total_segments, 3u);
    EXPECT_EQ(v.segment_index, 2u);
    ASSERT_EQ(v.size, data.size());
    EXPECT_EQ(v.data, b.data() + kPayloadHeaderSize);
    EXPECT_TRUE(std::equal(data.begin(), data.end(), v.data));
}

TEST(Protocol, PayloadWithEmptyData) {
    auto b = encode_payload(std::numeric_limits<uint64_t>::max(), 0, nullptr, 0);
    PayloadView v;
    ASSERT_EQ(decode_payload(b.data(), b.size(), v), DecodeError::Ok);
    EXPECT_EQ(v.total_segments, std::numeric_limits<uint64_t>::max());
    EXPECT_EQ(v.size, 0u);
}

TEST(Protocol, ShortInputIsTooShort) {
    auto offer = encode_offer(1, 2);
    auto req = encode_request(99);
    auto pay = encode_payload(1, 0, nullptr, 0);
    Offer o;
    Request r;
    PayloadView p;
    for (size_t n = 0; n < kOfferSize; ++n)
        EXPECT_EQ(decode_offer(offer.data(), n, o), DecodeError::TooShort) << n;
    for (size_t n = 0; n < kRequestSize; ++n)
        EXPECT_EQ(decode_request(req.data(), n, r), DecodeError::TooShort) << n;
    for (size_t n = 0; n < kPayloadHeaderSize; ++n)
        EXPECT_EQ(decode_payload(pay.data(), n, p), DecodeError::TooShort) << n;
}

TEST(Protocol, BadCookieWinsOverType) {
    for (int type = 0; type < 256; ++type) {
        std::vector<uint8_t> b(kPayloadHeaderSize + 4, 0);
        b[0] = 0xAB; b[1] = 0xCD; b[2] = 0xDC; b[3] = 0xBB; // last cookie byte off by one
        b[4] = static_cast<uint8_t>(type);
        Offer o;
        Request r;
        PayloadView p;
        EXPECT_EQ(decode_offer(b.data(), b.size(), o), DecodeError::BadCookie);
        EXPECT_EQ(decode_request(b.data(), b.size(), r), DecodeError::BadCookie);
        EXPECT_EQ(decode_payload(b.data(), b.size(), p), DecodeError::BadCookie);
    }
}

TEST(Protocol, WrongTypeIsBadType) {
    auto req = encode_request(5000);
    Offer o;
    PayloadView p;
    EXPECT_EQ(decode_offer(req.data(), req.size(), o), DecodeError::BadType);
    auto pay = encode_payload(1, 0, nullptr, 0);
    Request r;
    EXPECT_EQ(decode_request(pay.data(), pay.size(), r), DecodeError::BadType);
    auto offer = encode_offer(1, 2);
    offer.resize(kPayloadHeaderSize);
    EXPECT_EQ(decode_payload(offer.data(), offer.size(), p), DecodeError::BadType);
}

TEST(Protocol, NullBufferIsTooShort) {
    Offer o;
    EXPECT_EQ(decode_offer(nullptr, 9, o), DecodeError::TooShort);
}

TEST(Protocol, SizeLine) {
    EXPECT_EQ(encode_size_line(65536), "65536\n");
    uint64_t v = 0;
    EXPECT_TRUE(parse_size_line("65536", v));
    EXPECT_EQ(v, 65536u);
    EXPECT_TRUE(parse_size_line(" 42\r\n", v));
    EXPECT_EQ(v, 42u);
    EXPECT_TRUE(parse_size_line("0", v));
    EXPECT_EQ(v, 0u);
    EXPECT_TRUE(parse_size_line("18446744073709551615", v));
    EXPECT_EQ(v, std::numeric_limits<uint64_t>::max());

    EXPECT_FALSE(parse_size_line("", v));
    EXPECT_FALSE(parse_size_line("  \n", v));
    EXPECT_FALSE(parse_size_line("-5", v));
    EXPECT_FALSE(parse_size_line("+5", v));
    EXPECT_FALSE(parse_size_line("12a", v));
    EXPECT_FALSE(parse_size_line("1 2", v));
    EXPECT_FALSE(parse_size_line("18446744073709551616", v));
}

TEST(Protocol, SegmentCountIsCeiling) {
    EXPECT_EQ(total_segments(0), 0u);
    EXPECT_EQ(total_segments(1), 1u);
    EXPECT_EQ(total_segments(1024), 1u);
    EXPECT_EQ(total_segments(1025), 2u);
    EXPECT_EQ(total_segments(2500), 3u);
    EXPECT_EQ(total_segments(10, 3), 4u);
}

TEST(Protocol, SegmentLengthsSumToFileSize) {
    const uint64_t sizes[] = {1, 452, 1023, 1024, 1025, 2500, 65536, 1000003};
    for (uint64_t size : sizes) {
        const uint64_t total = total_segments(size);
        uint64_t sum = 0;
        for (uint64_t i = 0; i < total; ++i) {
            const size_t len = segment_length(size, i);
            EXPECT_GT(len, 0u);
            EXPECT_LE(len, kPacketCap);
            sum += len;
        }
        EXPECT_EQ(sum, size);
        EXPECT_EQ(segment_length(size, total), 0u);
    }
}

TEST(Protocol, SegmentLengthsFor2500) {
    EXPECT_EQ(segment_length(2500, 0), 1024u);
    EXPECT_EQ(segment_length(2500, 1), 1024u);
    EXPECT_EQ(segment_length(2500, 2), 452u);
}

TEST(Protocol, DecodeErrorNames) {
    EXPECT_STREQ(to_string(DecodeError::TooShort), "too short");
    EXPECT_STREQ(to_string(DecodeError::BadCookie), "bad cookie");
    EXPECT_STREQ(to_string(DecodeError::BadType), "bad type");
}
