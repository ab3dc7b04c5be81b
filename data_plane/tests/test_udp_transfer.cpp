#include "speedtest/network.hpp"
#include "speedtest/udp_transfer.hpp"
#include "speedtest/wire.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

speedtest::UdpClientOptions fast_client_options() {
    speedtest::UdpClientOptions options;
    options.receive_timeout = 100ms;
    options.max_quiet_timeouts = 5;
    options.progress_interval = 0ms;
    options.retry.backoff = 50ms;
    return options;
}

struct ServedRequest {
    std::optional<speedtest::UdpServeResult> result;
};

// Answers the first datagram that reaches the server socket.
std::thread serve_one(const speedtest::Socket &socket, const speedtest::StopToken &stop, ServedRequest &served) {
    return std::thread([&socket, &stop, &served] {
        if (!speedtest::wait_readable(socket, 5000ms)) {
            return;
        }
        std::vector<std::uint8_t> datagram;
        sockaddr_in sender{};
        speedtest::receive_datagram(socket, datagram, 2048, sender);
        served.result = speedtest::serve_udp_request(socket, datagram, sender, speedtest::UdpServeOptions{}, stop);
    });
}

void test_complete_transfer() {
    speedtest::StopToken stop;
    auto server_socket = speedtest::bind_udp("127.0.0.1", 0, false);
    const speedtest::NetworkEndpoint server{"127.0.0.1", speedtest::local_port(server_socket)};
    ServedRequest served;
    auto server_thread = serve_one(server_socket, stop, served);

    std::uint64_t last_progress = 0;
    auto record = speedtest::run_udp_transfer("U1", server, 10240, 1, fast_client_options(), stop,
                                              [&](const speedtest::TransferProgress &progress) {
                                                  assert(progress.delivered <= progress.total);
                                                  last_progress = progress.delivered;
                                              });
    server_thread.join();

    assert(served.result);
    assert(served.result->total_segments == 10);
    assert(served.result->emitted == 10);
    assert(record.outcome == speedtest::Outcome::Success);
    assert(record.total == 10);
    assert(record.delivered == 10);
    assert(record.lost == 0);
    assert(record.delivered_bytes() == 10240);
    assert(record.jitter_seconds >= 0.0);
    assert(last_progress == 10);
}

void test_quiet_period_ends_transfer() {
    speedtest::StopToken stop;
    auto server_socket = speedtest::bind_udp("127.0.0.1", 0, false);
    const speedtest::NetworkEndpoint server{"127.0.0.1", speedtest::local_port(server_socket)};
    ServedRequest served;
    auto server_thread = serve_one(server_socket, stop, served);

    const auto options = fast_client_options();
    const auto started = std::chrono::steady_clock::now();
    // Under one segment: nothing is sent and only silence ends the transfer.
    auto record = speedtest::run_udp_transfer("U2", server, 1000, 2, options, stop, nullptr);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    server_thread.join();

    assert(served.result);
    assert(served.result->total_segments == 0);
    assert(served.result->emitted == 0);
    assert(record.outcome == speedtest::Outcome::Success);
    assert(record.delivered == 0);
    assert(record.lost == 0);
    assert(elapsed >= (options.max_quiet_timeouts + 1) * options.receive_timeout);
}

void test_silent_server_counts_everything_lost() {
    speedtest::StopToken stop;
    // Bound but never answers.
    auto server_socket = speedtest::bind_udp("127.0.0.1", 0, false);
    const speedtest::NetworkEndpoint server{"127.0.0.1", speedtest::local_port(server_socket)};

    auto record = speedtest::run_udp_transfer("U3", server, 4096, 3, fast_client_options(), stop, nullptr);
    assert(record.outcome == speedtest::Outcome::Success);
    assert(record.delivered == 0);
    assert(record.lost == 4);
    assert(record.jitter_seconds == 0.0);

    std::vector<std::uint8_t> datagram;
    sockaddr_in sender{};
    assert(speedtest::wait_readable(server_socket, 1000ms));
    speedtest::receive_datagram(server_socket, datagram, 2048, sender);
    const auto request = speedtest::decode_request(datagram);
    assert(request.file_size == 4096);
    assert(request.stream_id == 3);
}

void test_invalid_request_is_dropped() {
    speedtest::StopToken stop;
    auto socket = speedtest::bind_udp("127.0.0.1", 0, false);
    const auto self = speedtest::resolve_ipv4({"127.0.0.1", speedtest::local_port(socket)});

    const std::vector<std::uint8_t> short_datagram{0xab, 0xcd};
    assert(!speedtest::serve_udp_request(socket, short_datagram, self, {}, stop));

    auto offer = speedtest::encode_offer(speedtest::Offer{1, 2});
    offer.resize(speedtest::kRequestSize, 0);
    assert(!speedtest::serve_udp_request(socket, offer, self, {}, stop));

    // Nothing was sent back.
    assert(!speedtest::wait_readable(socket, 100ms));
}

void test_stop_interrupts_emission() {
    speedtest::StopToken stop;
    stop.request_stop();
    auto socket = speedtest::bind_udp("127.0.0.1", 0, false);
    const auto self = speedtest::resolve_ipv4({"127.0.0.1", speedtest::local_port(socket)});
    speedtest::UdpServeOptions options;
    options.pacing_every = 5;
    const auto request = speedtest::encode_request(speedtest::Request{100 * 1024, 1});
    const auto result = speedtest::serve_udp_request(socket, request, self, options, stop);
    assert(result);
    assert(result->total_segments == 100);
    assert(result->emitted == 5);
}

// Linux refuses to send to port 0, so every attempt fails at the request.
void test_send_failure_is_retried_then_reported() {
    speedtest::StopToken stop;
    const auto options = fast_client_options();
    const auto started = std::chrono::steady_clock::now();
    auto record = speedtest::run_udp_transfer("U2", {"127.0.0.1", 0}, 4096, 2, options, stop, nullptr);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    assert(record.outcome == speedtest::Outcome::Failure);
    assert(record.attempts == options.retry.max_attempts);
    assert(record.failure_cause.find("sendto") != std::string::npos);
    assert(record.delivered == 0);
    assert(elapsed >= (options.retry.max_attempts - 1) * options.retry.backoff);
    assert(elapsed < 2000ms);
}

void test_undeliverable_segments_are_skipped() {
    speedtest::StopToken stop;
    auto socket = speedtest::bind_udp("127.0.0.1", 0, false);
    auto sender = speedtest::resolve_ipv4({"127.0.0.1", speedtest::local_port(socket)});
    sender.sin_port = 0;

    const auto request = speedtest::encode_request(speedtest::Request{4 * 1024, 1});
    const auto result = speedtest::serve_udp_request(socket, request, sender, {}, stop);
    assert(result);
    assert(result->total_segments == 4);
    assert(result->emitted == 0);
}

} // namespace

int main() {
    test_complete_transfer();
    test_quiet_period_ends_transfer();
    test_silent_server_counts_everything_lost();
    test_invalid_request_is_dropped();
    test_stop_interrupts_emission();
    test_send_failure_is_retried_then_reported();
    test_undeliverable_segments_are_skipped();
    return 0;
}
