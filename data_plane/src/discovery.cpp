#include "speedtest/discovery.hpp"

#include "speedtest/errors.hpp"
#include "speedtest/log.hpp"

#include <sstream>

namespace speedtest {

namespace {

const char *const kBeaconTag = "beacon";
const char *const kDiscoveryTag = "discovery";

} // namespace

DiscoveryBeacon::DiscoveryBeacon(const DiscoveryOptions &options, const Offer &offer)
    : options_(options), message_(encode_offer(offer)), socket_(open_udp_socket()) {
    enable_broadcast(socket_);
    destination_ = resolve_ipv4(NetworkEndpoint{options_.broadcast_address, options_.port});
}

void DiscoveryBeacon::broadcast_once() { send_datagram(socket_, message_, destination_); }

std::size_t DiscoveryBeacon::run(const StopToken &stop) {
    std::ostringstream oss;
    oss << "broadcasting offers to " << to_string(endpoint_of(destination_)) << " every "
        << options_.offer_interval.count() << " ms";
    log_info(kBeaconTag, oss.str());

    std::size_t sent = 0;
    do {
        try {
            broadcast_once();
            ++sent;
        } catch (const NetworkError &err) {
            log_warn(kBeaconTag, err.what());
        }
    } while (!stop.wait_for(options_.offer_interval));
    log_info(kBeaconTag, "stopped after " + std::to_string(sent) + " offers");
    return sent;
}

OfferListener::OfferListener(std::uint16_t port) : socket_(bind_udp("0.0.0.0", port, true)) {}

std::uint16_t OfferListener::port() const { return local_port(socket_); }

std::optional<ServerAddress> OfferListener::wait_for_offer(const StopToken &stop, std::chrono::milliseconds wait) {
    log_info(kDiscoveryTag, "Listening for server offers on UDP port " + std::to_string(port()) + "...");
    std::vector<std::uint8_t> buffer;
    while (!stop.stop_requested()) {
        if (!wait_readable(socket_, wait)) {
            ++idle_waits_;
            if (!stop.stop_requested()) {
                log_info(kDiscoveryTag, "No offers received yet... retrying.");
            }
            continue;
        }
        sockaddr_in from{};
        receive_datagram(socket_, buffer, 1024, from);
        try {
            const Offer offer = decode_offer(buffer.data(), buffer.size());
            ServerAddress address{endpoint_of(from).address, offer.udp_port, offer.tcp_port};
            std::ostringstream oss;
            oss << "Received offer from " << address.host << ": UDP=" << address.udp_port
                << ", TCP=" << address.tcp_port;
            log_info(kDiscoveryTag, oss.str());
            return address;
        } catch (const MalformedMessage &err) {
            ++dropped_;
            log_debug(kDiscoveryTag, err.what());
        } catch (const UnexpectedMessage &err) {
            ++dropped_;
            log_debug(kDiscoveryTag, err.what());
        }
    }
    return std::nullopt;
}

std::optional<ServerAddress> discover_server(const DiscoveryOptions &options, const StopToken &stop) {
    OfferListener listener(options.port);
    return listener.wait_for_offer(stop, options.listen_wait);
}

} // namespace speedtest
