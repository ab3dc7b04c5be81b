#include "speedtest/errors.hpp"
#include "speedtest/wire.hpp"

#include <cassert>
#include <cstdint>
#include <vector>

namespace {

template <typename Decode>
bool throws_malformed(Decode decode) {
    try {
        decode();
    } catch (const speedtest::MalformedMessage &) {
        return true;
    }
    return false;
}

template <typename Decode>
bool throws_unexpected(Decode decode) {
    try {
        decode();
    } catch (const speedtest::UnexpectedMessage &) {
        return true;
    }
    return false;
}

} // namespace

int main() {
    using namespace speedtest;

    const Offer offer{20001, 20002};
    const auto offer_bytes = encode_offer(offer);
    assert(offer_bytes.size() == kOfferSize);
    assert(decode_offer(offer_bytes) == offer);

    // Crafted {cookie, 0x2, udp_port, tcp_port}, big-endian.
    const std::vector<std::uint8_t> crafted{0xab, 0xcd, 0xdc, 0xba, 0x02, 0x4e, 0x21, 0x4e, 0x22};
    assert(offer_bytes == crafted);
    const auto crafted_offer = decode_offer(crafted);
    assert(crafted_offer.udp_port == 20001);
    assert(crafted_offer.tcp_port == 20002);

    const Request request{10240, 7};
    const auto request_bytes = encode_request(request);
    assert(request_bytes.size() == kRequestSize);
    assert(request_bytes[4] == kRequestType);
    assert(request_bytes[12] == 0x00 && request_bytes[11] == 0x28);
    assert(request_bytes[20] == 0x07);
    assert(decode_request(request_bytes) == request);

    const Payload payload{10, 3, std::vector<std::uint8_t>(kSegmentSize, 0x5a)};
    const auto payload_bytes = encode_payload(payload);
    assert(payload_bytes.size() == kPayloadDatagramSize);
    assert(decode_payload(payload_bytes) == payload);
    const auto header = decode_payload_header(payload_bytes.data(), payload_bytes.size());
    assert(header.total_segments == 10);
    assert(header.sequence == 3);

    // Short data is padded with filler, long data truncated.
    const auto padded = decode_payload(encode_payload(Payload{1, 0, {1, 2, 3}}));
    assert(padded.data.size() == kSegmentSize);
    assert(padded.data[2] == 3 && padded.data[3] == kFillerByte);
    const auto truncated = encode_payload(Payload{1, 0, std::vector<std::uint8_t>(kSegmentSize + 100, 1)});
    assert(truncated.size() == kPayloadDatagramSize);

    for (std::size_t size = 0; size < kOfferSize; ++size) {
        assert(throws_malformed([&] { decode_offer(offer_bytes.data(), size); }));
    }
    for (std::size_t size = 0; size < kRequestSize; ++size) {
        assert(throws_malformed([&] { decode_request(request_bytes.data(), size); }));
    }
    for (std::size_t size = 0; size < kPayloadHeaderSize; ++size) {
        assert(throws_malformed([&] { decode_payload(payload_bytes.data(), size); }));
    }
    assert(throws_malformed([] { decode_offer(nullptr, 9); }));

    auto bad_cookie = offer_bytes;
    bad_cookie[0] = 0x00;
    assert(throws_unexpected([&] { decode_offer(bad_cookie); }));

    // A valid message of another type is not an offer.
    assert(throws_unexpected([&] { decode_offer(request_bytes); }));
    assert(throws_unexpected([&] { decode_request(payload_bytes); }));
    assert(throws_unexpected([&] { decode_payload(request_bytes); }));

    auto bad_type = request_bytes;
    bad_type[4] = 0x9;
    assert(throws_unexpected([&] { decode_request(bad_type); }));
    return 0;
}
