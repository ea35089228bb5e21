#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>
#include <rcache/client/commands.hpp>
#include <rcache/client/pool.hpp>

namespace rcache {

    struct TxResult {
        bool committed = false;
        std::vector<RespValue> replies;   // one per batched command when committed

        // First per-command error inside a committed transaction, if any.
        std::optional<std::string> first_error() const;
    };

    // Execution layer over the shared connection pool. Every mode returns the
    // lease on all exit paths; a connection that saw an exception is dropped
    // rather than reused, since its WATCH/MULTI state is unknown.
    class StoreClient {
    public:
        explicit StoreClient(std::shared_ptr<ConnectionPool> pool);

        // Simple: one logical operation on one connection.
        template <typename Fn>
        auto run(Fn&& fn) -> std::invoke_result_t<Fn, Commands&> {
            auto lease = pool_->acquire();
            try {
                Commands cmds(*lease);
                return std::forward<Fn>(fn)(cmds);
            }
            catch (...) {
                lease.invalidate();
                throw;
            }
        }

        // Pipelined: best-effort writes with no atomicity. Failures are logged
        // and swallowed; returns whether the batch reached the store.
        bool run_pipelined(const std::function<void(Batch&)>& fill) noexcept;

        // Transactional: all-or-nothing. Transport failures throw StoreUnavailable;
        // `committed == false` only when a watched key changed.
        TxResult run_transaction(const std::function<void(Batch&)>& fill);

        std::string ping();
        long long db_size();
        void flush_db();

        ConnectionPool& pool() { return *pool_; }

    private:
        std::shared_ptr<ConnectionPool> pool_;
    };

} // namespace rcache
