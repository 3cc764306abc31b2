/**
* @file
* @brief Orchestrator: thread-per-session fan-out and join.
*/

#include "speedtest/orchestrator.hpp"
#include "speedtest/tcp_transfer.hpp"
#include "speedtest/udp_transfer.hpp"

#include <exception>
#include <system_error>
#include <thread>

namespace speedtest {

/// \cond INTERNAL
namespace {

SessionResult failed_result(int connection_id, Protocol proto, uint64_t size, const std::string& err) {
    SessionResult res;
    res.connection_id = connection_id;
    res.protocol = proto;
    res.requested_bytes = size;
    res.error = err;
    return res;
}

} // namespace
/// \endcond

Orchestrator::Orchestrator(RunParams params, SocketFactory udp_factory, ThreadLauncher launch)
: params_(std::move(params)), udp_factory_(std::move(udp_factory)),
  launch_(launch ? std::move(launch) : default_launcher()) {
    if (!udp_factory_) {
        udp_factory_ = [] {
            auto s = std::make_unique<UdpSocket>();
            s->set_rcvbuf(1 << 20);
            return std::unique_ptr<ISocket>(std::move(s));
        };
    }
}

SessionResult Orchestrator::run_udp(int connection_id) {
    UdpSessionParams p;
    p.server = params_.server.udp();
    p.file_size = params_.file_size;
    p.connection_id = connection_id;
    p.idle_timeout_ms = params_.udp_idle_timeout_ms;
    try {
        auto sock = udp_factory_();
        return run_udp_session(*sock, p);
    } catch (const std::exception& e) {
        // Socket creation failed for this session only.
        return failed_result(connection_id, Protocol::UDP, params_.file_size, e.what());
    }
}

std::vector<SessionResult> Orchestrator::run() {
    const int tcp = params_.tcp_count > 0 ? params_.tcp_count : 0;
    const int udp = params_.udp_count > 0 ? params_.udp_count : 0;
    std::vector<SessionResult> results(static_cast<size_t>(tcp + udp));
    std::vector<std::thread> workers;
    workers.reserve(results.size());

    auto launch = [&](size_t slot, Protocol proto, int id, std::function<void()> job) {
        try {
            workers.push_back(launch_(std::move(job)));
        } catch (const std::system_error& e) {
            results[slot] = failed_result(id, proto, params_.file_size,
                                          std::string("cannot start session thread: ") + e.what());
        }
    };

    for (int i = 0; i < tcp; ++i) {
        launch(static_cast<size_t>(i), Protocol::TCP, i + 1, [this, &results, i] {
            TcpSessionParams p;
            p.server = params_.server.tcp();
            p.file_size = params_.file_size;
            p.connection_id = i + 1;
            p.read_timeout_ms = params_.tcp_read_timeout_ms;
            results[static_cast<size_t>(i)] = run_tcp_session(p);
        });
    }
    for (int i = 0; i < udp; ++i) {
        launch(static_cast<size_t>(tcp + i), Protocol::UDP, i + 1, [this, &results, tcp, i] {
            results[static_cast<size_t>(tcp + i)] = run_udp(i + 1);
        });
    }

    for (auto& t : workers) t.join();
    return results;
}

} // namespace speedtest
