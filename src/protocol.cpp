/**
* @file
* @brief Big-endian encoders/decoders for the discovery and transfer messages.
*
* @details Fields are written byte by byte instead of overlaying a packed struct
* so the layout is independent of host endianness and alignment.
*/

#include "speedtest/protocol.hpp"
#include <cctype>
#include <limits>

namespace speedtest {

/// \cond INTERNAL
namespace {

void put_u16(std::vector<uint8_t>& b, uint16_t v) {
    b.push_back(static_cast<uint8_t>(v >> 8));
    b.push_back(static_cast<uint8_t>(v));
}

void put_u32(std::vector<uint8_t>& b, uint32_t v) {
    for (int s = 24; s >= 0; s -= 8) b.push_back(static_cast<uint8_t>(v >> s));
}

void put_u64(std::vector<uint8_t>& b, uint64_t v) {
    for (int s = 56; s >= 0; s -= 8) b.push_back(static_cast<uint8_t>(v >> s));
}

uint16_t get_u16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

uint32_t get_u32(const uint8_t* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

uint64_t get_u64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) v = (v << 8) | p[i];
    return v;
}

std::vector<uint8_t> header(MessageType type, size_t reserve) {
    std::vector<uint8_t> b;
    b.reserve(reserve);
    put_u32(b, kMagicCookie);
    b.push_back(static_cast<uint8_t>(type));
    return b;
}

// Common prefix check shared by all decoders. Cookie before type.
DecodeError check_header(const uint8_t* buf, size_t len, size_t fixed, MessageType type) {
    if (buf == nullptr || len < fixed) return DecodeError::TooShort;
    if (get_u32(buf) != kMagicCookie) return DecodeError::BadCookie;
    if (buf[4] != static_cast<uint8_t>(type)) return DecodeError::BadType;
    return DecodeError::Ok;
}

} // namespace
/// \endcond

const char* to_string(DecodeError e) {
    switch (e) {
        case DecodeError::Ok:        return "ok";
        case DecodeError::TooShort:  return "too short";
        case DecodeError::BadCookie: return "bad cookie";
        case DecodeError::BadType:   return "bad type";
    }
    return "unknown";
}

std::vector<uint8_t> encode_offer(uint16_t udp_port, uint16_t tcp_port) {
    auto b = header(MessageType::Offer, kOfferSize);
    put_u16(b, udp_port);
    put_u16(b, tcp_port);
    return b;
}

DecodeError decode_offer(const uint8_t* buf, size_t len, Offer& out) {
    DecodeError e = check_header(buf, len, kOfferSize, MessageType::Offer);
    if (e != DecodeError::Ok) return e;
    out.udp_port = get_u16(buf + 5);
    out.tcp_port = get_u16(buf + 7);
    return DecodeError::Ok;
}

std::vector<uint8_t> encode_request(uint64_t file_size) {
    auto b = header(MessageType::Request, kRequestSize);
    put_u64(b, file_size);
    return b;
}

DecodeError decode_request(const uint8_t* buf, size_t len, Request& out) {
    DecodeError e = check_header(buf, len, kRequestSize, MessageType::Request);
    if (e != DecodeError::Ok) return e;
    out.file_size = get_u64(buf + 5);
    return DecodeError::Ok;
}

std::vector<uint8_t> encode_payload(uint64_t total, uint64_t index, const uint8_t* data, size_t len) {
    auto b = header(MessageType::Payload, kPayloadHeaderSize + len);
    put_u64(b, total);
    put_u64(b, index);
    if (len > 0) b.insert(b.end(), data, data + len);
    return b;
}

DecodeError decode_payload(const uint8_t* buf, size_t len, PayloadView& out) {
    DecodeError e = check_header(buf, len, kPayloadHeaderSize, MessageType::Payload);
    if (e != DecodeError::Ok) return e;
    out.total_segments = get_u64(buf + 5);
    out.segment_index  = get_u64(buf + 13);
    out.data = buf + kPayloadHeaderSize;
    out.size = len - kPayloadHeaderSize;
    return DecodeError::Ok;
}

std::string encode_size_line(uint64_t file_size) {
    return std::to_string(file_size) + "\n";
}

bool parse_size_line(const std::string& line, uint64_t& out) {
    size_t b = 0, e = line.size();
    while (b < e && std::isspace(static_cast<unsigned char>(line[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(line[e - 1]))) --e;
    if (b == e) return false;

    constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
    uint64_t v = 0;
    for (size_t i = b; i < e; ++i) {
        const char c = line[i];
        if (c < '0' || c > '9') return false;
        const uint64_t d = static_cast<uint64_t>(c - '0');
        if (v > (kMax - d) / 10) return false; // overflow
        v = v * 10 + d;
    }
    out = v;
    return true;
}

} // namespace speedtest
