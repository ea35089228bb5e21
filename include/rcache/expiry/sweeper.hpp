#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <rcache/client/store_client.hpp>
#include <rcache/region/registry.hpp>
#include <rcache/time/clock.hpp>

namespace rcache {

    // Background purge of expired entries for every registered region.
    // Owned explicitly: start() spawns the thread, stop() (or destruction)
    // wakes and joins it.
    class ExpirySweeper {
    public:
        ExpirySweeper(const RegionRegistry& registry, std::shared_ptr<StoreClient> client,
            std::chrono::milliseconds interval, const clock::Clock& clk = clock::system());
        ~ExpirySweeper();

        ExpirySweeper(const ExpirySweeper&) = delete;
        ExpirySweeper& operator=(const ExpirySweeper&) = delete;

        void start();
        void stop();
        bool running() const;

        // One synchronous cycle over the registry; returns entries purged.
        std::size_t sweep_once();
        std::size_t sweep_region(const std::string& name);

        std::chrono::milliseconds interval() const { return interval_; }

    private:
        void loop();

        const RegionRegistry& registry_;
        std::shared_ptr<StoreClient> client_;
        std::chrono::milliseconds interval_;
        const clock::Clock& clock_;

        mutable std::mutex m_;
        std::condition_variable cv_;
        std::thread worker_;
        bool stop_ = false;
    };

} // namespace rcache
