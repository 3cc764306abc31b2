/**
* @file
* @brief TCP vs UDP comparison over loopback across file sizes and connection counts.
*
* @details
* For every (file size, connection count) pair a fresh in-process server is
* started on ephemeral ports, the orchestrator runs `count` TCP and `count` UDP
* sessions against 127.0.0.1, and the mean speed (MB/s) and total time per
* protocol are printed. Discovery is skipped; the ports are taken from the server directly.
*
* CLI options
*  - `--udp-pacing-us <n>` : Delay between UDP segments (default: 100).
*  - `--idle-ms <n>`       : UDP idle timeout (default: 500).
*  - `--no-color`          : Plain log lines.
*  - `--help`              : Print usage and exit.
*/

#include "speedtest/log.hpp"
#include "speedtest/orchestrator.hpp"
#include "speedtest/report.hpp"
#include "speedtest/server.hpp"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>

using namespace speedtest;

int main(int argc, char** argv) {
    int pacing_us = 100;
    int idle_ms = 500;
    for (int i = 1; i < argc; i++) {
        if (!strcmp(argv[i], "--udp-pacing-us") && i + 1 < argc) pacing_us = atoi(argv[++i]);
        else if (!strcmp(argv[i], "--idle-ms") && i + 1 < argc) idle_ms = atoi(argv[++i]);
        else if (!strcmp(argv[i], "--no-color")) set_log_color(false);
        else if (!strcmp(argv[i], "--help")) {
            std::cout << "speedtest_experiment --udp-pacing-us <n> --idle-ms <n> [--no-color]\n";
            return 0;
        }
    }

    const uint64_t kSizes[] = {128 * 1024, 512 * 1024, 1024 * 1024};
    const int kCounts[] = {1, 2, 4, 8};

    std::cout << "Starting UDP vs TCP transfer comparison...\n\n";
    try {
        for (uint64_t size : kSizes) {
            for (int count : kCounts) {
                char title[128];
                snprintf(title, sizeof(title), "Test Settings: %d connections, File size: %.2f MB",
                         count, static_cast<double>(size) / (1024 * 1024));
                log_info("experiment", title, LogTone::Peach);

                ServerConfig cfg;
                cfg.broadcast = false;
                cfg.udp.pacing_us = pacing_us;
                SpeedServer server(cfg);
                server.start();

                RunParams params;
                params.server = ServerInfo{"127.0.0.1", server.tcp_port(), server.udp_port()};
                params.file_size = size;
                params.tcp_count = count;
                params.udp_count = count;
                params.udp_idle_timeout_ms = idle_ms;
                auto results = Orchestrator(params).run();
                server.stop();

                for (const auto& r : results)
                    if (!r.ok()) log_error("experiment", format_result(r));
                std::cout << format_experiment_summary(summarize(results)) << "\n";
            }
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Experiment error: " << e.what() << "\n";
        return 1;
    }
}
