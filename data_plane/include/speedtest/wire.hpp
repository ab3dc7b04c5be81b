#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace speedtest {

constexpr std::uint32_t kMagicCookie = 0xabcddcbau;

constexpr std::uint8_t kOfferType = 0x2;
constexpr std::uint8_t kRequestType = 0x3;
constexpr std::uint8_t kPayloadType = 0x4;

constexpr std::size_t kOfferSize = 9;
constexpr std::size_t kRequestSize = 21;
constexpr std::size_t kPayloadHeaderSize = 21;

// Every payload datagram carries exactly kSegmentSize data bytes after its header.
constexpr std::size_t kSegmentSize = 1024;
constexpr std::size_t kPayloadDatagramSize = kPayloadHeaderSize + kSegmentSize;
constexpr std::uint8_t kFillerByte = 'A';

struct Offer {
    std::uint16_t udp_port;
    std::uint16_t tcp_port;
};

struct Request {
    std::uint64_t file_size;
    std::uint64_t stream_id;
};

struct PayloadHeader {
    std::uint64_t total_segments;
    std::uint64_t sequence;
};

struct Payload {
    std::uint64_t total_segments;
    std::uint64_t sequence;
    std::vector<std::uint8_t> data;
};

bool operator==(const Offer &lhs, const Offer &rhs);
bool operator==(const Request &lhs, const Request &rhs);
bool operator==(const Payload &lhs, const Payload &rhs);

std::vector<std::uint8_t> encode_offer(const Offer &offer);
std::vector<std::uint8_t> encode_request(const Request &request);
// Pads data with kFillerByte or truncates it to kSegmentSize.
std::vector<std::uint8_t> encode_payload(const Payload &payload);

Offer decode_offer(const std::uint8_t *data, std::size_t size);
Request decode_request(const std::uint8_t *data, std::size_t size);
PayloadHeader decode_payload_header(const std::uint8_t *data, std::size_t size);
Payload decode_payload(const std::uint8_t *data, std::size_t size);

inline Offer decode_offer(const std::vector<std::uint8_t> &buffer) {
    return decode_offer(buffer.data(), buffer.size());
}

inline Request decode_request(const std::vector<std::uint8_t> &buffer) {
    return decode_request(buffer.data(), buffer.size());
}

inline Payload decode_payload(const std::vector<std::uint8_t> &buffer) {
    return decode_payload(buffer.data(), buffer.size());
}

} // namespace speedtest
