#pragma once

#include "speedtest/config.hpp"
#include "speedtest/network.hpp"
#include "speedtest/stop_token.hpp"
#include "speedtest/wire.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace speedtest {

// Server side: broadcasts the Offer every offer_interval until stopped.
class DiscoveryBeacon {
  public:
    DiscoveryBeacon(const DiscoveryOptions &options, const Offer &offer);

    void broadcast_once();

    // Send failures are logged and retried on the next tick. Returns the
    // number of offers sent.
    std::size_t run(const StopToken &stop);

  private:
    DiscoveryOptions options_;
    std::vector<std::uint8_t> message_;
    Socket socket_;
    sockaddr_in destination_{};
};

// Client side: one-shot wait for the first valid Offer.
class OfferListener {
  public:
    // Binds port with address reuse so several clients on one host can listen.
    explicit OfferListener(std::uint16_t port);

    std::uint16_t port() const;

    // Waits in slices of `wait`, logging between them, until an Offer arrives
    // or stop is requested. Unparseable datagrams are dropped.
    std::optional<ServerAddress> wait_for_offer(const StopToken &stop, std::chrono::milliseconds wait);

    std::size_t idle_waits() const noexcept { return idle_waits_; }

    std::size_t dropped() const noexcept { return dropped_; }

  private:
    Socket socket_;
    std::size_t idle_waits_{0};
    std::size_t dropped_{0};
};

std::optional<ServerAddress> discover_server(const DiscoveryOptions &options, const StopToken &stop);

} // namespace speedtest
