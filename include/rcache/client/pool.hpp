#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include <rcache/client/connection.hpp>

namespace rcache {

    class ConnectionPool;

    // RAII lease of a pooled connection. Returned to the pool on destruction
    // unless it broke or was invalidated, in which case it is discarded.
    class PooledConnection {
    public:
        PooledConnection(ConnectionPool& pool, std::unique_ptr<Connection> conn)
            : pool_(&pool), conn_(std::move(conn)) {}
        ~PooledConnection();

        PooledConnection(const PooledConnection&) = delete;
        PooledConnection& operator=(const PooledConnection&) = delete;
        PooledConnection(PooledConnection&& o) noexcept
            : pool_(o.pool_), conn_(std::move(o.conn_)), invalid_(o.invalid_) {}
        PooledConnection& operator=(PooledConnection&&) = delete;

        Connection& operator*() { return *conn_; }
        Connection* operator->() { return conn_.get(); }

        // Drop the connection instead of returning it (unknown protocol state).
        void invalidate() { invalid_ = true; }

    private:
        ConnectionPool* pool_;
        std::unique_ptr<Connection> conn_;
        bool invalid_ = false;
    };

    struct PoolOptions {
        std::size_t maxSize = 8;
        std::chrono::milliseconds acquireTimeout{ 2000 };
    };

    // Bounded pool shared by every region, the timestamper and the sweeper.
    class ConnectionPool {
    public:
        using Factory = std::function<std::unique_ptr<Connection>()>;

        ConnectionPool(Factory factory, PoolOptions opts);
        ~ConnectionPool() = default;

        ConnectionPool(const ConnectionPool&) = delete;
        ConnectionPool& operator=(const ConnectionPool&) = delete;

        // Blocks up to acquireTimeout for a free slot; throws StoreUnavailable
        // on timeout or when a new connection cannot be opened.
        PooledConnection acquire();

        std::size_t idle() const;
        std::size_t open() const;
        std::size_t max_size() const { return opts_.maxSize; }

    private:
        friend class PooledConnection;
        void release(std::unique_ptr<Connection> conn, bool reusable);

        Factory factory_;
        PoolOptions opts_;
        mutable std::mutex m_;
        std::condition_variable cv_;
        std::vector<std::unique_ptr<Connection>> idle_;
        std::size_t open_ = 0;   // leased + idle
    };

} // namespace rcache
