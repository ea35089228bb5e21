#include <asio.hpp>
#include <algorithm>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <rcache/core/router.hpp>
#include <rcache/net/server.hpp>
#include <rcache/util/log.hpp>

using namespace rcache;

int main(int argc, char** argv) {
    uint16_t port = 6379;
    size_t shards = 0;  // 0 => hardware_concurrency()
    size_t threads = 0; // io threads, 0 => hardware_concurrency()

    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        try {
            if ((a == "--port" || a == "-p") && i + 1 < argc) {
                port = static_cast<uint16_t>(std::stoi(argv[++i]));
            }
            else if (a == "--shards" && i + 1 < argc) {
                shards = static_cast<size_t>(std::stoull(argv[++i]));
            }
            else if (a == "--threads" && i + 1 < argc) {
                threads = static_cast<size_t>(std::stoull(argv[++i]));
            }
            else if (a == "--log-level" && i + 1 < argc) {
                log::set_level(log::level_from_string(argv[++i]));
            }
            else if (a == "--help" || a == "-?") {
                std::cout << "Usage: rcache-server [--port N] [--shards N] [--threads N] [--log-level L]\n";
                return 0;
            }
            else {
                std::cerr << "unknown argument: " << a << "\n";
                return 2;
            }
        }
        catch (const std::exception&) {
            std::cerr << "bad value for " << a << "\n";
            return 2;
        }
    }

    unsigned hc = std::max(1u, std::thread::hardware_concurrency());
    if (shards == 0) shards = hc;
    if (threads == 0) threads = hc;

    asio::io_context io;
    EmbeddedStore store(shards);

    try {
        Server server(io, port, store);

        asio::signal_set signals(io, SIGINT, SIGTERM);
        signals.async_wait([&](const asio::error_code&, int) {
            log::infof("server", "shutting down");
            server.close();
            io.stop();
            });

        log::infof("server", "rcache RESP server on {} with {} shard{} and {} io thread{}",
            server.local_port(), shards, shards == 1 ? "" : "s", threads, threads == 1 ? "" : "s");

        std::vector<std::thread> pool;
        for (size_t i = 1; i < threads; ++i) pool.emplace_back([&io] { io.run(); });
        io.run();
        for (auto& t : pool) t.join();
    }
    catch (const std::exception& e) {
        log::errorf("server", "fatal: {}", e.what());
        return 1;
    }
    return 0;
}
