#include <rcache/client/pool.hpp>
#include <rcache/util/errors.hpp>
#include <rcache/util/log.hpp>

namespace rcache {

    PooledConnection::~PooledConnection() {
        if (!conn_) return;   // moved-from
        bool reusable = !invalid_ && !conn_->broken();
        pool_->release(std::move(conn_), reusable);
    }

    ConnectionPool::ConnectionPool(Factory factory, PoolOptions opts)
        : factory_(std::move(factory))
        , opts_(opts) {
        if (opts_.maxSize == 0) opts_.maxSize = 1;
    }

    PooledConnection ConnectionPool::acquire() {
        std::unique_lock<std::mutex> lk(m_);
        bool ready = cv_.wait_for(lk, opts_.acquireTimeout, [&] {
            return !idle_.empty() || open_ < opts_.maxSize;
            });
        if (!ready) {
            throw StoreUnavailable("timed out acquiring a pooled connection after " +
                std::to_string(opts_.acquireTimeout.count()) + "ms");
        }

        if (!idle_.empty()) {
            auto conn = std::move(idle_.back());
            idle_.pop_back();
            return PooledConnection(*this, std::move(conn));
        }

        // reserve the slot, then connect without holding the lock
        ++open_;
        lk.unlock();
        std::unique_ptr<Connection> conn;
        try {
            conn = factory_();
        }
        catch (...) {
            {
                std::lock_guard<std::mutex> g(m_);
                --open_;
            }
            cv_.notify_one();
            throw;
        }
        if (!conn) {
            {
                std::lock_guard<std::mutex> g(m_);
                --open_;
            }
            cv_.notify_one();
            throw StoreUnavailable("connection factory returned no connection");
        }
        return PooledConnection(*this, std::move(conn));
    }

    void ConnectionPool::release(std::unique_ptr<Connection> conn, bool reusable) {
        {
            std::lock_guard<std::mutex> lk(m_);
            if (reusable) {
                idle_.push_back(std::move(conn));
            }
            else {
                --open_;
            }
        }
        if (!reusable) {
            log::debugf("pool", "discarded a broken connection");
            conn.reset();
        }
        cv_.notify_one();
    }

    std::size_t ConnectionPool::idle() const {
        std::lock_guard<std::mutex> lk(m_);
        return idle_.size();
    }

    std::size_t ConnectionPool::open() const {
        std::lock_guard<std::mutex> lk(m_);
        return open_;
    }

} // namespace rcache
