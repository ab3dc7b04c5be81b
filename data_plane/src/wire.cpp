#include "speedtest/wire.hpp"

#include "speedtest/errors.hpp"

#include <arpa/inet.h>

#include <algorithm>
#include <cstring>
#include <sstream>

#if defined(__linux__)
#include <endian.h>
#elif defined(__APPLE__)
#include <libkern/OSByteOrder.h>
#define htobe64(x) OSSwapHostToBigInt64(x)
#define be64toh(x) OSSwapBigToHostInt64(x)
#endif

namespace speedtest {

namespace {

void put_u16(std::uint8_t *out, std::uint16_t value) {
    const std::uint16_t net = htons(value);
    std::memcpy(out, &net, sizeof(net));
}

void put_u32(std::uint8_t *out, std::uint32_t value) {
    const std::uint32_t net = htonl(value);
    std::memcpy(out, &net, sizeof(net));
}

void put_u64(std::uint8_t *out, std::uint64_t value) {
    const std::uint64_t net = htobe64(value);
    std::memcpy(out, &net, sizeof(net));
}

std::uint16_t get_u16(const std::uint8_t *in) {
    std::uint16_t net;
    std::memcpy(&net, in, sizeof(net));
    return ntohs(net);
}

std::uint32_t get_u32(const std::uint8_t *in) {
    std::uint32_t net;
    std::memcpy(&net, in, sizeof(net));
    return ntohl(net);
}

std::uint64_t get_u64(const std::uint8_t *in) {
    std::uint64_t net;
    std::memcpy(&net, in, sizeof(net));
    return be64toh(net);
}

void put_preamble(std::uint8_t *out, std::uint8_t type) {
    put_u32(out, kMagicCookie);
    out[4] = type;
}

// Checks length, cookie and type shared by all three messages.
void check_preamble(const std::uint8_t *data, std::size_t size, std::size_t header_size,
                    std::uint8_t expected_type, const char *name) {
    if (data == nullptr || size < header_size) {
        std::ostringstream oss;
        oss << name << " needs " << header_size << " bytes, got " << size;
        throw MalformedMessage(oss.str());
    }
    const std::uint32_t cookie = get_u32(data);
    if (cookie != kMagicCookie) {
        std::ostringstream oss;
        oss << name << " has bad magic cookie 0x" << std::hex << cookie;
        throw UnexpectedMessage(oss.str());
    }
    if (data[4] != expected_type) {
        std::ostringstream oss;
        oss << name << " has unexpected message type " << static_cast<int>(data[4]);
        throw UnexpectedMessage(oss.str());
    }
}

} // namespace

bool operator==(const Offer &lhs, const Offer &rhs) {
    return lhs.udp_port == rhs.udp_port && lhs.tcp_port == rhs.tcp_port;
}

bool operator==(const Request &lhs, const Request &rhs) {
    return lhs.file_size == rhs.file_size && lhs.stream_id == rhs.stream_id;
}

bool operator==(const Payload &lhs, const Payload &rhs) {
    return lhs.total_segments == rhs.total_segments && lhs.sequence == rhs.sequence &&
           lhs.data == rhs.data;
}

std::vector<std::uint8_t> encode_offer(const Offer &offer) {
    std::vector<std::uint8_t> buffer(kOfferSize);
    put_preamble(buffer.data(), kOfferType);
    put_u16(buffer.data() + 5, offer.udp_port);
    put_u16(buffer.data() + 7, offer.tcp_port);
    return buffer;
}

std::vector<std::uint8_t> encode_request(const Request &request) {
    std::vector<std::uint8_t> buffer(kRequestSize);
    put_preamble(buffer.data(), kRequestType);
    put_u64(buffer.data() + 5, request.file_size);
    put_u64(buffer.data() + 13, request.stream_id);
    return buffer;
}

std::vector<std::uint8_t> encode_payload(const Payload &payload) {
    std::vector<std::uint8_t> buffer(kPayloadDatagramSize, kFillerByte);
    put_preamble(buffer.data(), kPayloadType);
    put_u64(buffer.data() + 5, payload.total_segments);
    put_u64(buffer.data() + 13, payload.sequence);
    const auto count = std::min(payload.data.size(), kSegmentSize);
    std::copy_n(payload.data.begin(), count, buffer.begin() + kPayloadHeaderSize);
    return buffer;
}

Offer decode_offer(const std::uint8_t *data, std::size_t size) {
    check_preamble(data, size, kOfferSize, kOfferType, "offer");
    return Offer{get_u16(data + 5), get_u16(data + 7)};
}

Request decode_request(const std::uint8_t *data, std::size_t size) {
    check_preamble(data, size, kRequestSize, kRequestType, "request");
    return Request{get_u64(data + 5), get_u64(data + 13)};
}

PayloadHeader decode_payload_header(const std::uint8_t *data, std::size_t size) {
    check_preamble(data, size, kPayloadHeaderSize, kPayloadType, "payload");
    return PayloadHeader{get_u64(data + 5), get_u64(data + 13)};
}

Payload decode_payload(const std::uint8_t *data, std::size_t size) {
    const auto header = decode_payload_header(data, size);
    Payload payload{header.total_segments, header.sequence, {}};
    const auto available = std::min(size - kPayloadHeaderSize, kSegmentSize);
    payload.data.assign(data + kPayloadHeaderSize, data + kPayloadHeaderSize + available);
    return payload;
}

} // namespace speedtest
