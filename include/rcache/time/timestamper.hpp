#pragma once
#include <memory>
#include <string>
#include <rcache/client/store_client.hpp>
#include <rcache/time/clock.hpp>

namespace rcache {

    struct TimestampResult {
        long long value = 0;
        bool strict = true;     // false when produced by the INCR fallback
    };

    // Cluster-wide monotonic timestamps kept in one string key of the store.
    //
    // Optimistic path: WATCH key; GET; candidate = max(now, counter) + 1;
    // MULTI SET EXEC. A lost race retries up to kMaxAttempts times, then the
    // counter is simply INCRemented. Transport failures propagate.
    class Timestamper {
    public:
        static constexpr int kMaxAttempts = 5;

        Timestamper(std::shared_ptr<StoreClient> client, std::string default_key,
            const clock::Clock& clk = clock::system());

        long long next();
        long long next(const std::string& key);
        TimestampResult next_checked(const std::string& key);

        const std::string& default_key() const { return key_; }

    private:
        std::shared_ptr<StoreClient> client_;
        std::string key_;
        const clock::Clock& clock_;
    };

} // namespace rcache
