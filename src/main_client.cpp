/**
* @file
* @brief Client entry point: discover a server, run the concurrent sessions, print results.
*
* @details
* Each cycle binds the discovery port, waits for an Offer, obtains the run
* parameters (command line or interactive prompts), fans out the sessions and
* prints one line per session plus a summary. Cycles repeat until SIGINT/SIGTERM
* or, with `--once`, after the first run.
*
* CLI options
*  - `--discovery-port <p>` : UDP port to listen for Offers (default: 54321).
*  - `--tcp <n>`            : TCP connections per run (prompted when absent).
*  - `--udp <n>`            : UDP connections per run (prompted when absent).
*  - `--size <bytes>`       : File size per session (prompted when absent).
*  - `--idle-ms <n>`        : UDP idle timeout (default: 1000).
*  - `--once`               : Exit after one run.
*  - `--no-color`           : Plain log lines.
*  - `--help`               : Print usage and exit.
*
* Exit codes
*  - `0` after an interrupt or a completed `--once` run.
*  - `1` if the discovery port cannot be bound.
*/

#include "speedtest/discovery.hpp"
#include "speedtest/errors.hpp"
#include "speedtest/log.hpp"
#include "speedtest/orchestrator.hpp"
#include "speedtest/protocol.hpp"
#include "speedtest/report.hpp"
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>

using namespace speedtest;

static std::atomic<bool> g_stop{false};

static void handle_signal(int) {
    g_stop = true;
}

/// Prompt for a non-negative integer; false on EOF or malformed input.
static bool prompt_number(const char* prompt, uint64_t& out) {
    std::cout << prompt << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) return false;
    return parse_size_line(line, out);
}

struct ClientOptions {
    DiscoveryConfig discovery;
    int64_t  tcp     = -1; ///< -1 = ask.
    int64_t  udp     = -1;
    int64_t  size    = -1;
    int      idle_ms = 1000;
    bool     once    = false;
};

/// Fill counts and size from options, prompting for what is missing.
static bool obtain_params(const ClientOptions& opt, RunParams& p) {
    uint64_t tcp = 0, udp = 0, size = 0;
    if (opt.tcp >= 0) tcp = static_cast<uint64_t>(opt.tcp);
    else if (!prompt_number("Enter the number of TCP connections: ", tcp)) return false;
    if (opt.udp >= 0) udp = static_cast<uint64_t>(opt.udp);
    else if (!prompt_number("Enter the number of UDP connections: ", udp)) return false;
    if (opt.size >= 0) size = static_cast<uint64_t>(opt.size);
    else if (!prompt_number("Enter the file size: ", size)) return false;

    constexpr uint64_t kMaxConns = 10000;
    if (size == 0 || tcp > kMaxConns || udp > kMaxConns) return false;
    p.tcp_count = static_cast<int>(tcp);
    p.udp_count = static_cast<int>(udp);
    p.file_size = size;
    return true;
}

int main(int argc, char** argv) {
    ClientOptions opt;
    for (int i = 1; i < argc; i++) {
        if (!strcmp(argv[i], "--discovery-port") && i + 1 < argc) opt.discovery.port = (uint16_t)atoi(argv[++i]);
        else if (!strcmp(argv[i], "--tcp") && i + 1 < argc) opt.tcp = atoll(argv[++i]);
        else if (!strcmp(argv[i], "--udp") && i + 1 < argc) opt.udp = atoll(argv[++i]);
        else if (!strcmp(argv[i], "--size") && i + 1 < argc) opt.size = atoll(argv[++i]);
        else if (!strcmp(argv[i], "--idle-ms") && i + 1 < argc) opt.idle_ms = atoi(argv[++i]);
        else if (!strcmp(argv[i], "--once")) opt.once = true;
        else if (!strcmp(argv[i], "--no-color")) set_log_color(false);
        else if (!strcmp(argv[i], "--help")) {
            std::cout << "speedtest_client --discovery-port <p> --tcp <n> --udp <n> --size <bytes> --idle-ms <n> [--once] [--no-color]\n";
            return 0;
        }
    }

    if (opt.tcp < -1 || opt.udp < -1 || opt.size < -1 || opt.size == 0) {
        std::cerr << "Client error: connection counts must be >= 0 and --size must be positive\n";
        return 1;
    }

    std::signal(SIGINT,  handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        while (!g_stop) {
            ServerInfo server;
            {
                DiscoveryListener listener(std::make_unique<UdpSocket>(), opt.discovery);
                log_info("client", "Client started, listening for offer requests...", LogTone::Peach);
                try {
                    server = listener.await_offer(g_stop);
                } catch (const NoOfferReceived& e) {
                    log_warn("client", std::string("Error listening for offers: ") + e.what());
                    break;
                }
            }
            log_info("client", "Received offer from " + server.address + " (tcp " +
                     std::to_string(server.tcp_port) + ", udp " + std::to_string(server.udp_port) + ")",
                     LogTone::Peach);

            RunParams params;
            params.server = server;
            params.udp_idle_timeout_ms = opt.idle_ms;
            if (!obtain_params(opt, params)) {
                if (std::cin.eof() || g_stop) break;
                log_warn("client", "Invalid input. Please enter valid integers for connections and a positive file size.");
                std::cin.clear();
                continue;
            }

            auto results = Orchestrator(params).run();
            for (const auto& r : results) {
                if (r.ok()) log_info("client", format_result(r), LogTone::Blue);
                else log_error("client", format_result(r));
            }
            std::cout << format_summary(summarize(results));
            log_info("client", "All transfers complete.", LogTone::Cyan);
            if (opt.once) break;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Client error: " << e.what() << "\n";
        return 1;
    }
}
