#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace rcache {

    // Flat key=value configuration, in the spirit of a .properties file:
    //
    //   # comment
    //   rcache.host = cache-01
    //   rcache.expiry_in_seconds.Entity = 300
    //
    // Later assignments of the same key win.
    class Properties {
    public:
        Properties() = default;

        static Properties from_string(std::string_view text);
        // Throws std::runtime_error when the file cannot be read.
        static Properties load(const std::string& path);

        void set(std::string key, std::string value);
        bool contains(const std::string& key) const;

        std::optional<std::string> get(const std::string& key) const;
        std::string get(const std::string& key, const std::string& def) const;
        // Malformed numbers fall back to the default.
        long long get_int(const std::string& key, long long def) const;
        bool get_bool(const std::string& key, bool def) const;

        // Copy of *this with every entry of `overrides` applied on top.
        Properties with_overrides(const Properties& overrides) const;

        std::size_t size() const { return entries_.size(); }
        const std::map<std::string, std::string>& entries() const { return entries_; }

    private:
        std::map<std::string, std::string> entries_;
    };

    // Property names
    namespace keys {
        constexpr const char* kBackend = "rcache.backend";
        constexpr const char* kHost = "rcache.host";
        constexpr const char* kPort = "rcache.port";
        constexpr const char* kTimeoutMs = "rcache.timeout_ms";
        constexpr const char* kPoolMaxSize = "rcache.pool.max_size";
        constexpr const char* kPoolAcquireTimeoutMs = "rcache.pool.acquire_timeout_ms";
        constexpr const char* kExpiryInSeconds = "rcache.expiry_in_seconds";
        constexpr const char* kTimeBasedExpiry = "rcache.time_based_expiry";
        constexpr const char* kCacheLockTimeout = "rcache.cache_lock_timeout";
        constexpr const char* kSweepIntervalMs = "rcache.sweep_interval_ms";
        constexpr const char* kTimestampKey = "rcache.timestamp_key";
        constexpr const char* kLogLevel = "rcache.log_level";
    } // namespace keys

    enum class Backend { Tcp, Embedded };

    struct FactorySettings {
        Backend backend = Backend::Tcp;
        struct {
            std::string host = "localhost";
            int port = 6379;
            int timeoutMs = 2000;       // per round-trip send/receive timeout
        } server;
        struct {
            std::size_t maxSize = 8;
            int acquireTimeoutMs = 2000;
        } pool;
        int expiryInSeconds = 120;      // default region expiry
        int cacheLockTimeoutMs = 60 * 1000;
        int sweepIntervalMs = 1000;
        std::string timestampKey = "rcache:timestamp";
        std::string logLevel = "info";

        static FactorySettings from_properties(const Properties& props);
    };

    // Per-region view of the configuration.
    struct RegionSettings {
        std::string name;
        int expiryInSeconds = 120;
        bool timeBasedExpiry = true;    // maintain the expiration index for this region
        int cacheLockTimeoutMs = 60 * 1000;

        // `rcache.expiry_in_seconds.<name>` and `rcache.time_based_expiry.<name>`
        // override the global values.
        static RegionSettings from_properties(const std::string& name, const Properties& props,
            const FactorySettings& defaults);
    };

} // namespace rcache
