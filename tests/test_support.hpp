#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <rcache/client/local_connection.hpp>
#include <rcache/client/pool.hpp>
#include <rcache/client/store_client.hpp>
#include <rcache/core/router.hpp>
#include <rcache/time/clock.hpp>
#include <rcache/util/errors.hpp>

namespace rcache::test {

    // Deterministic wall clock for expiry and timestamp tests.
    class ManualClock : public clock::Clock {
    public:
        explicit ManualClock(clock::Millis start = 1'700'000'000'000) : now_(start) {}
        clock::Millis now_ms() const override { return now_.load(); }
        void set(clock::Millis t) { now_.store(t); }
        void advance_ms(clock::Millis d) { now_.fetch_add(d); }
        void advance_s(long long s) { advance_ms(s * clock::kMillisPerSecond); }

    private:
        std::atomic<clock::Millis> now_;
    };

    // Embedded connection that fails like a dropped socket while `down` is set.
    class FaultyConnection : public Connection {
    public:
        FaultyConnection(EmbeddedStore& store, std::shared_ptr<std::atomic<bool>> down)
            : inner_(store), down_(std::move(down)) {}

        RespValue execute(const CommandArgs& cmd) override {
            check();
            return inner_.execute(cmd);
        }
        std::vector<RespValue> execute_batch(const std::vector<CommandArgs>& cmds) override {
            check();
            return inner_.execute_batch(cmds);
        }
        bool broken() const override { return broken_; }

    private:
        void check() {
            if (down_->load()) {
                broken_ = true;
                throw StoreUnavailable("injected outage");
            }
        }

        LocalConnection inner_;
        std::shared_ptr<std::atomic<bool>> down_;
        bool broken_ = false;
    };

    // Lets a rival client INCR `key` right before each of the next `conflicts`
    // transactions, so a WATCH on it fails.
    class ConflictingConnection : public Connection {
    public:
        ConflictingConnection(EmbeddedStore& store, std::string key, std::shared_ptr<std::atomic<int>> conflicts)
            : inner_(store), rival_(store), key_(std::move(key)), conflicts_(std::move(conflicts)) {}

        RespValue execute(const CommandArgs& cmd) override { return inner_.execute(cmd); }
        std::vector<RespValue> execute_batch(const std::vector<CommandArgs>& cmds) override {
            bool is_tx = !cmds.empty() && cmds.back().size() == 1 && cmds.back()[0] == "EXEC";
            if (is_tx && conflicts_->load() > 0) {
                conflicts_->fetch_sub(1);
                rival_.execute({ "INCR", key_ });
            }
            return inner_.execute_batch(cmds);
        }
        bool broken() const override { return false; }

    private:
        LocalConnection inner_;
        LocalConnection rival_;
        std::string key_;
        std::shared_ptr<std::atomic<int>> conflicts_;
    };

    // Runs pipelined batches one command at a time and calls `between` once,
    // right after the first command of the first pipelined batch.
    class InterleavingConnection : public Connection {
    public:
        InterleavingConnection(EmbeddedStore& store, std::shared_ptr<std::function<void()>> between)
            : inner_(store), between_(std::move(between)) {}

        RespValue execute(const CommandArgs& cmd) override { return inner_.execute(cmd); }
        std::vector<RespValue> execute_batch(const std::vector<CommandArgs>& cmds) override {
            bool is_tx = !cmds.empty() && cmds.back().size() == 1 && cmds.back()[0] == "EXEC";
            if (is_tx || cmds.size() < 2 || !*between_) return inner_.execute_batch(cmds);

            std::vector<RespValue> replies;
            replies.push_back(inner_.execute(cmds.front()));
            auto hook = std::move(*between_);
            *between_ = nullptr;
            hook();
            for (std::size_t i = 1; i < cmds.size(); ++i) replies.push_back(inner_.execute(cmds[i]));
            return replies;
        }
        bool broken() const override { return false; }

    private:
        LocalConnection inner_;
        std::shared_ptr<std::function<void()>> between_;
    };

    inline std::shared_ptr<ConnectionPool> local_pool(EmbeddedStore& store, std::size_t max_size = 4) {
        PoolOptions opts;
        opts.maxSize = max_size;
        opts.acquireTimeout = std::chrono::milliseconds(500);
        return std::make_shared<ConnectionPool>(
            [&store] { return std::make_unique<LocalConnection>(store); }, opts);
    }

    inline std::shared_ptr<StoreClient> local_client(EmbeddedStore& store, std::size_t max_size = 4) {
        return std::make_shared<StoreClient>(local_pool(store, max_size));
    }

    inline std::shared_ptr<StoreClient> faulty_client(EmbeddedStore& store, std::shared_ptr<std::atomic<bool>> down) {
        PoolOptions opts;
        opts.maxSize = 2;
        opts.acquireTimeout = std::chrono::milliseconds(200);
        auto pool = std::make_shared<ConnectionPool>(
            [&store, down] { return std::make_unique<FaultyConnection>(store, down); }, opts);
        return std::make_shared<StoreClient>(pool);
    }

    inline std::shared_ptr<StoreClient> interleaving_client(EmbeddedStore& store, std::function<void()> between) {
        auto hook = std::make_shared<std::function<void()>>(std::move(between));
        PoolOptions opts;
        opts.maxSize = 1;
        opts.acquireTimeout = std::chrono::milliseconds(500);
        auto pool = std::make_shared<ConnectionPool>(
            [&store, hook] { return std::make_unique<InterleavingConnection>(store, hook); }, opts);
        return std::make_shared<StoreClient>(pool);
    }

} // namespace rcache::test
