#include <rcache/client/store_client.hpp>
#include <rcache/util/errors.hpp>
#include <rcache/util/log.hpp>

namespace rcache {

    std::optional<std::string> TxResult::first_error() const {
        for (auto& r : replies) {
            if (r.is_error()) return r.str;
        }
        return std::nullopt;
    }

    StoreClient::StoreClient(std::shared_ptr<ConnectionPool> pool)
        : pool_(std::move(pool)) {
        if (!pool_) throw RegionStateError("store client requires a connection pool");
    }

    bool StoreClient::run_pipelined(const std::function<void(Batch&)>& fill) noexcept {
        try {
            Batch batch;
            fill(batch);
            if (batch.empty()) return true;
            auto replies = run([&](Commands& c) { return c.pipeline(batch); });
            for (size_t i = 0; i < replies.size(); ++i) {
                if (replies[i].is_error()) {
                    log::warnf("store", "pipelined {} rejected: {}", batch.commands()[i][0], replies[i].str);
                }
            }
            return true;
        }
        catch (const std::exception& e) {
            log::warnf("store", "pipelined cleanup failed, ignored: {}", e.what());
            return false;
        }
    }

    TxResult StoreClient::run_transaction(const std::function<void(Batch&)>& fill) {
        Batch batch;
        fill(batch);
        TxResult res;
        if (batch.empty()) {
            res.committed = true;
            return res;
        }
        auto replies = run([&](Commands& c) { return c.exec(batch); });
        if (replies) {
            res.committed = true;
            res.replies = std::move(*replies);
        }
        return res;
    }

    std::string StoreClient::ping() {
        return run([](Commands& c) { return c.ping(); });
    }

    long long StoreClient::db_size() {
        return run([](Commands& c) { return c.dbsize(); });
    }

    void StoreClient::flush_db() {
        log::infof("store", "flushing the whole database");
        run([](Commands& c) { c.flushdb(); });
    }

} // namespace rcache
