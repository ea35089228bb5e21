#include <rcache/expiry/sweeper.hpp>
#include <rcache/region/region.hpp>
#include <rcache/util/errors.hpp>
#include <rcache/util/log.hpp>

namespace rcache {

    ExpirySweeper::ExpirySweeper(const RegionRegistry& registry, std::shared_ptr<StoreClient> client,
        std::chrono::milliseconds interval, const clock::Clock& clk)
        : registry_(registry)
        , client_(std::move(client))
        , interval_(interval)
        , clock_(clk) {
        if (!client_) throw RegionStateError("sweeper requires a store client");
        if (interval_.count() <= 0) interval_ = std::chrono::milliseconds(1000);
    }

    ExpirySweeper::~ExpirySweeper() {
        stop();
    }

    void ExpirySweeper::start() {
        std::lock_guard<std::mutex> lk(m_);
        if (worker_.joinable()) return;
        stop_ = false;
        worker_ = std::thread([this] { loop(); });
        log::infof("sweeper", "started, interval {}ms", interval_.count());
    }

    void ExpirySweeper::stop() {
        std::thread t;
        {
            std::lock_guard<std::mutex> lk(m_);
            if (!worker_.joinable()) return;
            stop_ = true;
            t = std::move(worker_);
        }
        cv_.notify_all();
        t.join();
        log::infof("sweeper", "stopped");
    }

    bool ExpirySweeper::running() const {
        std::lock_guard<std::mutex> lk(m_);
        return worker_.joinable();
    }

    void ExpirySweeper::loop() {
        std::unique_lock<std::mutex> lk(m_);
        for (;;) {
            if (cv_.wait_for(lk, interval_, [&] { return stop_; })) return;
            lk.unlock();
            try {
                sweep_once();
            }
            catch (const std::exception& e) {
                log::errorf("sweeper", "cycle failed: {}", e.what());
            }
            lk.lock();
        }
    }

    std::size_t ExpirySweeper::sweep_once() {
        std::size_t purged = 0;
        for (auto& name : registry_.snapshot()) {
            try {
                purged += sweep_region(name);
            }
            catch (const CacheError& e) {
                log::warnf("sweeper", "region '{}' skipped: {}", name, e.what());
            }
        }
        if (purged > 0) log::debugf("sweeper", "purged {} expired entries", purged);
        return purged;
    }

    std::size_t ExpirySweeper::sweep_region(const std::string& name) {
        RegionSettings s;
        s.name = name;
        s.timeBasedExpiry = true;
        return Region(std::move(s), client_, clock_).evict_expired();
    }

} // namespace rcache
