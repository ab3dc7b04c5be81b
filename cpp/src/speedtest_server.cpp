#include "speedtest/config.hpp"
#include "speedtest/discovery.hpp"
#include "speedtest/errors.hpp"
#include "speedtest/log.hpp"
#include "speedtest/session_dispatcher.hpp"
#include "speedtest/signals.hpp"
#include "speedtest/stop_token.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

namespace {

void print_usage() {
    std::cerr << "Usage:\n"
                 "  speedtest_server [--bind <host>] [--tcp-port <port>] [--udp-port <port>]\n"
                 "                   [--discovery-port <port>] [--broadcast <address>]\n"
                 "                   [--max-sessions <count>]\n"
                 "                   [--verbose | --quiet]\n"
                 "  A service port of 0 lets the system choose; the chosen port is advertised.\n";
}

int run_server(const speedtest::ServerConfig &config) {
    speedtest::set_log_level(config.log_level);
    speedtest::StopToken stop;
    speedtest::SignalStopper signals(stop);

    speedtest::log_info("main", "Running Server...");
    speedtest::SessionDispatcher dispatcher(config);
    if (!dispatcher.tcp_enabled() && !dispatcher.udp_enabled()) {
        speedtest::log_error("main", "neither TCP nor UDP could be bound");
        return EXIT_FAILURE;
    }
    speedtest::DiscoveryBeacon beacon(config.discovery, dispatcher.offer());

    std::thread beacon_thread([&] { beacon.run(stop); });
    std::thread tcp_thread([&] { dispatcher.run_tcp(stop); });
    std::thread udp_thread([&] { dispatcher.run_udp(stop); });
    speedtest::log_info("main", "Press Ctrl+C to stop the server.");

    beacon_thread.join();
    tcp_thread.join();
    udp_thread.join();
    speedtest::log_info("main", "Server stopped.");
    return EXIT_SUCCESS;
}

} // namespace

int main(int argc, char **argv) {
    if (argc > 1) {
        std::string first = argv[1];
        if (first == "--help" || first == "-h") {
            print_usage();
            return EXIT_SUCCESS;
        }
    }
    try {
        return run_server(speedtest::parse_server_args(argc - 1, argv + 1));
    } catch (const speedtest::ConfigError &err) {
        std::cerr << "error: " << err.what() << std::endl;
        print_usage();
        return EXIT_FAILURE;
    } catch (const speedtest::Error &err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
}
