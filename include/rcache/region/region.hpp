#pragma once
#include <atomic>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <rcache/client/store_client.hpp>
#include <rcache/codec/codec.hpp>
#include <rcache/config/properties.hpp>
#include <rcache/time/clock.hpp>

namespace rcache {

    class Timestamper;

    // Store layout of a region: the entries live in the hash `<region>`, the
    // expiration index in the sorted set `z:<region>` (member = key,
    // score = absolute expiry in epoch ms).
    inline std::string region_key(const std::string& region) { return region; }
    inline std::string index_key(const std::string& region) { return "z:" + region; }

    // One named cache region. Reads and cleanup degrade to "absent" on store
    // failure; writes are atomic and propagate their failures.
    class Region {
    public:
        Region(RegionSettings settings, std::shared_ptr<StoreClient> client,
            const clock::Clock& clk = clock::system(), std::shared_ptr<Timestamper> timestamper = nullptr);

        const std::string& name() const { return settings_.name; }
        const RegionSettings& settings() const { return settings_; }

        bool exists(const std::string& key);

        // Entries whose indexed expiry is not in the future are removed and
        // reported absent. A hit on an indexed entry slides its expiry to
        // now + expiration_seconds; unindexed entries stay unindexed.
        std::optional<Value> get(const std::string& key, long long expiration_seconds);
        std::optional<Value> get(const std::string& key);
        std::vector<std::optional<Value>> get_many(const std::vector<std::string>& keys);

        // Throws SerializationError, StoreUnavailable, TransactionAborted or CommandError.
        void put(const std::string& key, const Value& value, long long ttl_seconds);
        void put(const std::string& key, const Value& value);

        void remove(const std::string& key);
        void remove_all(const std::vector<std::string>& keys);

        std::vector<std::string> keys();
        long long size();               // -1 when the store is unreachable
        long long size_in_store();      // whole database, -1 on failure
        std::map<std::string, Value> as_map();

        // Purges every indexed entry whose expiry has passed. Listing and
        // purging are separate round trips, so a put that lands in between
        // loses its value while its fresh index entry stays; the next read
        // of that key is a miss.
        std::size_t evict_expired();

        // Logical delete; the stored data is left alone.
        void clear();
        void destroy();
        bool is_deleted() const { return deleted_.load(); }

        long long next_timestamp();
        int timeout() const { return settings_.cacheLockTimeoutMs; }

    private:
        bool indexed() const { return settings_.timeBasedExpiry; }
        std::optional<Value> decode_or_miss(const std::string& key, const std::string& raw) const;
        void cleanup(const std::vector<std::string>& keys);

        RegionSettings settings_;
        std::string hash_;
        std::string index_;
        std::shared_ptr<StoreClient> client_;
        const clock::Clock& clock_;
        std::shared_ptr<Timestamper> timestamper_;
        ValueCodec codec_;
        std::atomic<bool> deleted_{ false };
    };

} // namespace rcache
