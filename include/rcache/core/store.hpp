#pragma once
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>
#include <rcache/core/sorted_set.hpp>

namespace rcache {

    enum class ValueType { None, String, Hash, ZSet };

    // Raised when a command targets a key holding another type.
    class WrongTypeError : public std::runtime_error {
    public:
        WrongTypeError() : std::runtime_error("Operation against a key holding the wrong kind of value") {}
    };

    // In-memory shard of the backing store. Keys have no native expiry; every
    // write bumps the key's version so WATCH can detect concurrent writers.
    class Shard {
    public:
        Shard() = default;
        Shard(const Shard&) = delete;
        Shard& operator=(const Shard&) = delete;
        Shard(Shard&&) = delete;
        Shard& operator=(Shard&&) = delete;

        // STRINGS
        std::optional<std::string> get(const std::string& k);
        void set(const std::string& k, std::string v);
        // INCRBY; throws std::invalid_argument if the value is not an integer,
        // std::overflow_error on overflow
        long long incr_by(const std::string& k, long long delta);
        // DEL on any type
        bool del(const std::string& k);

        // HASHES (all return Redis-like integers/bulk semantics)

        // HSET key field value -> returns 1 if new field, 0 if updated
        int hset(const std::string& key, const std::string& field, const std::string& value);
        std::optional<std::string> hget(const std::string& key, const std::string& field);
        // HDEL key field -> returns #fields removed (0 or 1 here)
        int hdel(const std::string& key, const std::string& field);
        int hexists(const std::string& key, const std::string& field);
        long long hlen(const std::string& key);
        // HGETALL key -> vector of [field, value, field, value, ...]
        std::vector<std::string> hgetall(const std::string& key);
        std::vector<std::string> hkeys(const std::string& key);

        // SORTED SETS

        // ZADD key score member -> 1 if new member, 0 if score updated
        int zadd(const std::string& key, double score, const std::string& member);
        std::optional<double> zscore(const std::string& key, const std::string& member);
        std::vector<std::string> zrangebyscore(const std::string& key, ScoreBound min, ScoreBound max);
        int zrem(const std::string& key, const std::string& member);
        long long zremrangebyscore(const std::string& key, ScoreBound min, ScoreBound max);

        ValueType type_of(const std::string& key);
        std::uint64_t version(const std::string& key) const;
        std::size_t key_count() const;
        void flush();

    private:
        ValueType type_of_unlocked(const std::string& key) const;
        void expect_type_unlocked(const std::string& key, ValueType want) const;
        void touch_unlocked(const std::string& key) { versions_[key] = ++next_version_; }

        mutable std::shared_mutex mu_;
        // String keys
        std::unordered_map<std::string, std::string> map_;
        // Hash keys: key -> (field -> value)
        std::unordered_map<std::string, std::unordered_map<std::string, std::string>> hmap_;
        // Sorted-set keys
        std::unordered_map<std::string, SortedSet> zmap_;
        // Last write version per key; kept after deletion so a delete+recreate
        // between WATCH and EXEC is still seen as a change
        std::unordered_map<std::string, std::uint64_t> versions_;
        std::uint64_t next_version_ = 0;
    };

    class Store {
    public:
        explicit Store(size_t n_shards = 1);
        Shard& shard_for(const std::string& key);
        Shard& shard_by_index(size_t i) { return *shards_[i]; }
        size_t shard_count() const { return shards_.size(); }

        long long db_size() const;
        void flush_all();
        std::uint64_t version(const std::string& key);

        // Ordinary commands hold this shared; EXEC holds it exclusively so a
        // queued transaction applies with no interleaving.
        std::shared_mutex& exec_mutex() { return exec_mu_; }

    private:
        std::vector<std::unique_ptr<Shard>> shards_;
        std::shared_mutex exec_mu_;
    };

} // namespace rcache
