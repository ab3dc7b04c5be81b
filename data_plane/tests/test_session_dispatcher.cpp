#include "speedtest/discovery.hpp"
#include "speedtest/network.hpp"
#include "speedtest/session_dispatcher.hpp"
#include "speedtest/transfer_orchestrator.hpp"

#include <sys/resource.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

speedtest::ServerConfig loopback_config() {
    speedtest::ServerConfig config;
    config.bind_address = "127.0.0.1";
    config.tcp_port = 0;
    config.udp_port = 0;
    config.poll_interval = 200ms;
    config.tcp.poll_interval = 100ms;
    return config;
}

void test_discover_and_run_end_to_end() {
    speedtest::StopToken server_stop;
    speedtest::SessionDispatcher dispatcher(loopback_config());
    assert(dispatcher.tcp_enabled());
    assert(dispatcher.udp_enabled());
    const auto offer = dispatcher.offer();
    assert(offer.tcp_port != 0);
    assert(offer.udp_port != 0);

    speedtest::OfferListener listener(0);
    speedtest::DiscoveryOptions discovery;
    discovery.broadcast_address = "127.0.0.1";
    discovery.port = listener.port();
    discovery.offer_interval = 200ms;
    speedtest::DiscoveryBeacon beacon(discovery, offer);

    std::thread beacon_thread([&] { beacon.run(server_stop); });
    std::thread tcp_thread([&] { dispatcher.run_tcp(server_stop); });
    std::thread udp_thread([&] { dispatcher.run_udp(server_stop); });

    speedtest::StopToken client_stop;
    const auto server = listener.wait_for_offer(client_stop, 3000ms);
    assert(server);
    assert(server->tcp_port == offer.tcp_port);
    assert(server->udp_port == offer.udp_port);

    speedtest::TcpClientOptions tcp;
    tcp.poll_interval = 100ms;
    speedtest::UdpClientOptions udp;
    udp.receive_timeout = 200ms;
    speedtest::SocketTransferEngine engine(*server, tcp, udp, client_stop);
    speedtest::TransferOrchestrator orchestrator(engine, nullptr, 20ms, client_stop);
    const auto records = orchestrator.run(speedtest::TestParameters{20480, 2, 2});

    assert(records.size() == 4);
    for (const auto &record : records) {
        assert(record.outcome == speedtest::Outcome::Success);
        if (record.protocol == speedtest::Protocol::Tcp) {
            assert(record.delivered == 20480);
        } else {
            assert(record.total == 20);
            assert(record.delivered <= record.total);
            assert(record.delivered + record.lost == record.total);
        }
    }

    const auto stopped_at = std::chrono::steady_clock::now();
    server_stop.request_stop();
    beacon_thread.join();
    tcp_thread.join();
    udp_thread.join();
    assert(std::chrono::steady_clock::now() - stopped_at < 2000ms);
}

void test_bind_conflict_disables_one_role() {
    auto taken = speedtest::listen_tcp("127.0.0.1", 0);
    auto config = loopback_config();
    config.tcp_port = speedtest::local_port(taken);

    speedtest::SessionDispatcher dispatcher(config);
    assert(!dispatcher.tcp_enabled());
    assert(dispatcher.udp_enabled());
    assert(dispatcher.offer().tcp_port == 0);
    assert(dispatcher.offer().udp_port != 0);

    speedtest::StopToken stop;
    stop.request_stop();
    dispatcher.run_tcp(stop);
    dispatcher.run_udp(stop);

    speedtest::StopToken client_stop;
    speedtest::SocketTransferEngine engine({"127.0.0.1", dispatcher.offer().udp_port, 0}, {}, {}, client_stop);
    const auto record = engine.run_tcp("T1", 1024, nullptr);
    assert(record.outcome == speedtest::Outcome::Failure);
    assert(record.failure_cause == "server does not offer TCP");
}

void test_noise_does_not_stop_udp_loop() {
    speedtest::StopToken stop;
    speedtest::SessionDispatcher dispatcher(loopback_config());
    const auto udp_port = dispatcher.offer().udp_port;
    std::thread udp_thread([&] { dispatcher.run_udp(stop); });

    auto client = speedtest::open_udp_socket();
    const auto server = speedtest::resolve_ipv4({"127.0.0.1", udp_port});
    speedtest::send_datagram(client, {0xde, 0xad}, server);
    speedtest::send_datagram(client, speedtest::encode_request(speedtest::Request{2048, 9}), server);

    std::vector<std::uint8_t> datagram;
    sockaddr_in from{};
    std::size_t payloads = 0;
    while (payloads < 2 && speedtest::wait_readable(client, 2000ms)) {
        speedtest::receive_datagram(client, datagram, 2048, from);
        const auto header = speedtest::decode_payload_header(datagram.data(), datagram.size());
        assert(header.total_segments == 2);
        assert(datagram.size() == speedtest::kPayloadDatagramSize);
        ++payloads;
    }
    assert(payloads == 2);

    stop.request_stop();
    udp_thread.join();
}

void test_udp_requests_beyond_limit_are_dropped() {
    speedtest::UdpServeOptions options;
    options.max_sessions = 1;
    options.pacing_every = 1;
    options.pacing_pause = 5ms;
    speedtest::UdpSessionListener listener("127.0.0.1", 0, options);
    const auto server = speedtest::resolve_ipv4({"127.0.0.1", listener.port()});
    speedtest::StopToken stop;
    std::thread udp_thread([&] { listener.run(stop, 100ms); });

    // Long enough to keep the only handler busy for the whole test.
    auto busy_client = speedtest::open_udp_socket();
    speedtest::send_datagram(busy_client, speedtest::encode_request(speedtest::Request{1 << 30, 1}), server);
    assert(speedtest::wait_readable(busy_client, 2000ms));

    auto turned_away = speedtest::open_udp_socket();
    speedtest::send_datagram(turned_away, speedtest::encode_request(speedtest::Request{2048, 2}), server);
    for (int i = 0; i < 200 && listener.rejected() == 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    assert(listener.rejected() == 1);
    assert(listener.sessions() == 1);
    assert(!speedtest::wait_readable(turned_away, 200ms));

    const auto stopped_at = std::chrono::steady_clock::now();
    stop.request_stop();
    udp_thread.join();
    assert(std::chrono::steady_clock::now() - stopped_at < 2000ms);
}

// With no descriptors left, every accept fails while the connection stays
// queued; the loop must pause between attempts and recover afterwards.
void test_accept_failures_back_off() {
    speedtest::TcpServeOptions options;
    options.io_timeout = 2000ms;
    options.poll_interval = 100ms;
    speedtest::TcpSessionListener listener("127.0.0.1", 0, options);
    speedtest::StopToken client_stop;
    auto client = speedtest::connect_tcp({"127.0.0.1", listener.port()}, 2000ms, 100ms, client_stop);

    const int next_fd = ::dup(0);
    assert(next_fd >= 0);
    ::close(next_fd);
    rlimit saved{};
    assert(::getrlimit(RLIMIT_NOFILE, &saved) == 0);
    rlimit exhausted = saved;
    exhausted.rlim_cur = static_cast<rlim_t>(next_fd);
    assert(::setrlimit(RLIMIT_NOFILE, &exhausted) == 0);

    speedtest::StopToken stop;
    std::thread tcp_thread([&] { listener.run(stop, 200ms); });
    std::this_thread::sleep_for(1000ms);
    stop.request_stop();
    tcp_thread.join();
    assert(::setrlimit(RLIMIT_NOFILE, &saved) == 0);

    assert(listener.accept_errors() >= 1);
    assert(listener.accept_errors() <= 10);
    assert(listener.sessions() == 0);

    // The queued connection is served once descriptors are available again.
    const std::string request = "1024\n";
    speedtest::send_all(client, request.data(), request.size());
    speedtest::StopToken second_stop;
    std::thread second_run([&] { listener.run(second_stop, 100ms); });
    std::size_t received = 0;
    char buffer[512];
    while (received < 1024 && speedtest::wait_readable(client, 2000ms)) {
        const auto got = speedtest::recv_some(client, buffer, sizeof(buffer));
        if (got == 0) {
            break;
        }
        received += got;
    }
    second_stop.request_stop();
    second_run.join();
    assert(received == 1024);
    assert(listener.sessions() == 1);
}

} // namespace

int main() {
    test_discover_and_run_end_to_end();
    test_bind_conflict_disables_one_role();
    test_noise_does_not_stop_udp_loop();
    test_udp_requests_beyond_limit_are_dropped();
    test_accept_failures_back_off();
    return 0;
}
