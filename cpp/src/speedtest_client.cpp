#include "speedtest/config.hpp"
#include "speedtest/discovery.hpp"
#include "speedtest/errors.hpp"
#include "speedtest/log.hpp"
#include "speedtest/report.hpp"
#include "speedtest/signals.hpp"
#include "speedtest/stop_token.hpp"
#include "speedtest/transfer_orchestrator.hpp"

#include <cstdlib>
#include <iostream>
#include <limits>
#include <optional>
#include <string>

namespace {

void print_usage() {
    std::cerr << "Usage:\n"
                 "  speedtest_client [--size <bytes>] [--tcp <count>] [--udp <count>]\n"
                 "                   [--discovery-port <port>] [--server <host:udp_port:tcp_port>]\n"
                 "                   [--verbose | --quiet]\n"
                 "  Missing --size/--tcp/--udp values are asked for interactively.\n";
}

std::uint64_t prompt_number(const std::string &question, std::uint64_t min_value, std::uint64_t max_value) {
    while (true) {
        std::cout << question << std::flush;
        std::string line;
        if (!std::getline(std::cin, line)) {
            throw speedtest::ConfigError("no input for: " + question);
        }
        try {
            auto value = speedtest::parse_unsigned(line, max_value, "number");
            if (value >= min_value) {
                return value;
            }
            std::cout << "Invalid number, please try again." << std::endl;
        } catch (const speedtest::ConfigError &err) {
            std::cout << err.what() << ", please try again." << std::endl;
        }
    }
}

speedtest::TestParameters resolve_parameters(const speedtest::ClientConfig &config) {
    speedtest::TestParameters params;
    params.file_size = config.file_size
                           ? *config.file_size
                           : prompt_number("Enter file size in bytes (e.g. 10240): ", 1,
                                           std::numeric_limits<std::uint64_t>::max());
    params.tcp_connections = config.tcp_connections
                                 ? *config.tcp_connections
                                 : static_cast<std::size_t>(prompt_number(
                                       "Enter number of TCP connections (e.g. 1): ", 0,
                                       std::numeric_limits<std::uint32_t>::max()));
    params.udp_connections = config.udp_connections
                                 ? *config.udp_connections
                                 : static_cast<std::size_t>(prompt_number(
                                       "Enter number of UDP connections (e.g. 1): ", 0,
                                       std::numeric_limits<std::uint32_t>::max()));
    params.validate();
    return params;
}

int run_client(const speedtest::ClientConfig &config) {
    speedtest::set_log_level(config.log_level);
    const auto params = resolve_parameters(config);

    speedtest::StopToken stop;
    speedtest::SignalStopper signals(stop);

    std::optional<speedtest::ServerAddress> server = config.server;
    if (!server) {
        server = speedtest::discover_server(config.discovery, stop);
    }
    if (!server) {
        speedtest::log_error("main", "No server offer received. Exiting.");
        return EXIT_FAILURE;
    }

    speedtest::log_info("main", "Starting speed test against server=" + server->host +
                                    ", file_size=" + std::to_string(params.file_size) +
                                    ", TCP=" + std::to_string(params.tcp_connections) +
                                    ", UDP=" + std::to_string(params.udp_connections));

    speedtest::SocketTransferEngine engine(*server, config.tcp, config.udp, stop);
    speedtest::ConsoleProgressSink sink;
    speedtest::TransferOrchestrator orchestrator(engine, &sink, config.stagger, stop);
    const auto records = orchestrator.run(params);

    const auto failures = speedtest::count_failures(records);
    if (failures > 0) {
        speedtest::log_warn("main", std::to_string(failures) + " of " + std::to_string(records.size()) +
                                        " transfers failed");
    }
    speedtest::log_info("main", "Client finished all transfers. Exiting.");
    stop.request_stop();
    return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
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
        return run_client(speedtest::parse_client_args(argc - 1, argv + 1));
    } catch (const speedtest::ConfigError &err) {
        std::cerr << "error: " << err.what() << std::endl;
        print_usage();
        return EXIT_FAILURE;
    } catch (const speedtest::Error &err) {
        std::cerr << "error: " << err.what() << std::endl;
        return EXIT_FAILURE;
    }
}
