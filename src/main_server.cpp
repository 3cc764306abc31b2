/**
* @file
* @brief Server entry point: parses CLI, starts/stops SpeedServer, handles signals.
*
* CLI options
*  - `--discovery-port <p>` : UDP port Offers are sent to (default: 54321).
*  - `--broadcast-ip <ip>`  : Offer destination (default: 255.255.255.255).
*  - `--interval-ms <n>`    : Gap between Offers (default: 1000).
*  - `--udp-pacing-us <n>`  : Delay between UDP segments (default: 1000, 0 = none).
*  - `--metrics-port <p>`   : Loopback HTTP port for /metrics (default: 0 = disabled).
*  - `--verbose | --quiet`  : Toggle the once-per-second counters line.
*  - `--no-color`           : Plain log lines.
*  - `--help`               : Print usage and exit.
*
* Exit codes
*  - `0` on normal termination (SIGINT/SIGTERM).
*  - `1` if sockets cannot be set up.
*/

#include "speedtest/server.hpp"
#include "speedtest/log.hpp"
#include <iostream>
#include <cstring>
#include <thread>
#include <chrono>
#include <atomic>
#include <csignal>
#include <cstdlib>

using namespace speedtest;

// Global flag toggled by signal handlers to stop the server gracefully.
static std::atomic<bool> g_keepRunning{true};

static void handle_signal(int) {
    g_keepRunning = false;
}

int main(int argc, char** argv) {
    ServerConfig cfg;
    for (int i = 1; i < argc; i++) {
        if (!std::strcmp(argv[i], "--discovery-port") && i + 1 < argc) {
            cfg.discovery.port = static_cast<uint16_t>(std::atoi(argv[++i]));
        } else if (!std::strcmp(argv[i], "--broadcast-ip") && i + 1 < argc) {
            cfg.discovery.broadcast_ip = argv[++i];
        } else if (!std::strcmp(argv[i], "--interval-ms") && i + 1 < argc) {
            cfg.discovery.interval_ms = std::atoi(argv[++i]);
        } else if (!std::strcmp(argv[i], "--udp-pacing-us") && i + 1 < argc) {
            cfg.udp.pacing_us = std::atoi(argv[++i]);
        } else if (!std::strcmp(argv[i], "--metrics-port") && i + 1 < argc) {
            cfg.metrics_port = static_cast<uint16_t>(std::atoi(argv[++i]));
        } else if (!std::strcmp(argv[i], "--verbose")) {
            cfg.verbose = true;
        } else if (!std::strcmp(argv[i], "--quiet")) {
            cfg.verbose = false;
        } else if (!std::strcmp(argv[i], "--no-color")) {
            set_log_color(false);
        } else if (!std::strcmp(argv[i], "--help")) {
            std::cout
                << "speedtest_server "
                << "--discovery-port <p> "
                << "--broadcast-ip <ip> "
                << "--interval-ms <n> "
                << "--udp-pacing-us <n> "
                << "--metrics-port <p> "
                << "[--verbose|--quiet] [--no-color]\n";
            return 0;
        }
    }

    try {
        SpeedServer server(cfg);
        server.start();

        std::signal(SIGINT,  handle_signal);
        std::signal(SIGTERM, handle_signal);
        while (g_keepRunning) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        log_warn("server", "Shutting down server...");
        server.stop();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Server error: " << e.what() << "\n";
        return 1;
    }
}
