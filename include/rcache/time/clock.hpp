#pragma once
#include <chrono>
#include <cstdint>

namespace rcache::clock {

    // Expiry scores and timestamps are wall-clock epoch milliseconds so that
    // every process sharing a store agrees on them (modulo drift).
    using Millis = std::int64_t;

    constexpr Millis kMillisPerSecond = 1000;

    class Clock {
    public:
        virtual ~Clock() = default;
        virtual Millis now_ms() const = 0;
    };

    class SystemClock final : public Clock {
    public:
        Millis now_ms() const override {
            return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        }
    };

    // Process-wide system clock instance.
    const Clock& system();

    // Absolute expiry for a relative ttl; non-positive ttl means "never".
    inline Millis expiry_after(Millis now, long long ttl_seconds) {
        if (ttl_seconds <= 0) return 0;
        return now + static_cast<Millis>(ttl_seconds) * kMillisPerSecond;
    }

    inline bool is_expired(Millis expiry, Millis now) {
        return expiry <= now;
    }

} // namespace rcache::clock
