#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "speedtest/common.hpp"

/**
* @file
* @brief Wire codec for Offer / Request / Payload datagrams and the TCP size line.
*
* Layouts (all integers big-endian):
*  - Offer   : u32 cookie, u8 type=0x2, u16 udp_port, u16 tcp_port            (9 bytes)
*  - Request : u32 cookie, u8 type=0x3, u64 file_size                          (13 bytes)
*  - Payload : u32 cookie, u8 type=0x4, u64 total_segments, u64 segment_index,
*              followed by up to @ref kPacketCap data bytes                     (21 + n bytes)
*  - TCP size line: ASCII decimal digits terminated by '\n'.
*
* The codec performs no I/O. Decoders never allocate: a decoded Payload refers
* into the caller's buffer.
*/

namespace speedtest {

static constexpr size_t kOfferSize         = 9;
static constexpr size_t kRequestSize       = 13;
static constexpr size_t kPayloadHeaderSize = 21;

/// @brief Why a datagram was rejected. @c Ok means the output parameter is valid.
enum class DecodeError {
    Ok,
    TooShort,  ///< Fewer bytes than the fixed header.
    BadCookie, ///< Magic cookie mismatch (checked before the type byte).
    BadType,   ///< Type byte differs from the one the decoder expects.
};

/// @brief Short lowercase name for log lines ("too short", "bad cookie", ...).
const char* to_string(DecodeError e);

struct Offer {
    uint16_t udp_port = 0;
    uint16_t tcp_port = 0;

    bool operator==(const Offer& o) const { return udp_port == o.udp_port && tcp_port == o.tcp_port; }
};

struct Request {
    uint64_t file_size = 0;

    bool operator==(const Request& o) const { return file_size == o.file_size; }
};

/**
* @brief Decoded Payload segment.
*
* @warning @ref data points into the buffer passed to @ref decode_payload and is
*          only valid while that buffer is alive and unmodified.
*/
struct PayloadView {
    uint64_t       total_segments = 0;
    uint64_t       segment_index  = 0;
    const uint8_t* data           = nullptr;
    size_t         size           = 0;
};

std::vector<uint8_t> encode_offer(uint16_t udp_port, uint16_t tcp_port);
DecodeError decode_offer(const uint8_t* buf, size_t len, Offer& out);

std::vector<uint8_t> encode_request(uint64_t file_size);
DecodeError decode_request(const uint8_t* buf, size_t len, Request& out);

/**
* @brief Build one Payload datagram.
* @param data Segment bytes (may be null when @p len is 0).
*/
std::vector<uint8_t> encode_payload(uint64_t total_segments, uint64_t segment_index,
                                    const uint8_t* data, size_t len);
DecodeError decode_payload(const uint8_t* buf, size_t len, PayloadView& out);

/// @brief "<file_size>\n".
std::string encode_size_line(uint64_t file_size);

/**
* @brief Parse a size announcement (without or with its trailing newline).
*
* Leading/trailing ASCII whitespace (including '\r') is ignored. Anything other
* than one or more decimal digits fitting in 64 bits is rejected.
*
* @return true and sets @p out on success, false on a malformed line.
*/
bool parse_size_line(const std::string& line, uint64_t& out);

/// @brief ceil(file_size / cap); 0 for an empty file.
inline uint64_t total_segments(uint64_t file_size, size_t cap = kPacketCap) {
    return file_size / cap + (file_size % cap ? 1 : 0);
}

/// @brief Data length of segment @p index; the last one may be shorter than @p cap.
inline size_t segment_length(uint64_t file_size, uint64_t index, size_t cap = kPacketCap) {
    const uint64_t offset = index * cap;
    if (offset >= file_size) return 0;
    const uint64_t rest = file_size - offset;
    return rest < cap ? static_cast<size_t>(rest) : cap;
}

} // namespace speedtest
