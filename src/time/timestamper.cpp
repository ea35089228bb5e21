#include <rcache/time/timestamper.hpp>
#include <rcache/util/errors.hpp>
#include <rcache/util/log.hpp>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <optional>

namespace rcache {

    // Counter as stored; a missing or unreadable value counts as zero and is
    // overwritten by the next successful SET.
    static long long parse_counter(const std::optional<std::string>& raw, const std::string& key) {
        if (!raw || raw->empty()) return 0;
        errno = 0;
        char* end = nullptr;
        long long v = std::strtoll(raw->c_str(), &end, 10);
        if (errno != 0 || end != raw->c_str() + raw->size()) {
            log::warnf("timestamp", "counter '{}' holds a non-integer value, restarting from the clock", key);
            return 0;
        }
        return v;
    }

    Timestamper::Timestamper(std::shared_ptr<StoreClient> client, std::string default_key,
        const clock::Clock& clk)
        : client_(std::move(client))
        , key_(std::move(default_key))
        , clock_(clk) {
        if (!client_) throw RegionStateError("timestamper requires a store client");
        if (key_.empty()) throw RegionStateError("timestamper requires a counter key");
    }

    long long Timestamper::next() {
        return next_checked(key_).value;
    }

    long long Timestamper::next(const std::string& key) {
        return next_checked(key).value;
    }

    TimestampResult Timestamper::next_checked(const std::string& key) {
        for (int attempt = 1; attempt <= kMaxAttempts; ++attempt) {
            auto committed = client_->run([&](Commands& c) -> std::optional<long long> {
                c.watch(key);
                long long counter = parse_counter(c.get(key), key);
                long long candidate = std::max<long long>(clock_.now_ms(), counter) + 1;
                Batch b;
                b.set(key, std::to_string(candidate));
                if (!c.exec(b)) return std::nullopt;
                return candidate;
            });
            if (committed) return { *committed, true };
            log::debugf("timestamp", "lost race on '{}' (attempt {}/{})", key, attempt, kMaxAttempts);
        }

        long long v = client_->run([&](Commands& c) { return c.incr(key); });
        log::warnf("timestamp", "'{}' contended {} times, fell back to INCR -> {}", key, kMaxAttempts, v);
        return { v, false };
    }

} // namespace rcache
