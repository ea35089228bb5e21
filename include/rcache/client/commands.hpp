#pragma once
#include <optional>
#include <utility>
#include <string>
#include <vector>
#include <rcache/client/connection.hpp>

namespace rcache {

    // Ordered list of write commands sent as one transaction or pipeline.
    class Batch {
    public:
        Batch& hset(const std::string& key, const std::string& field, const std::string& value);
        Batch& hdel(const std::string& key, const std::string& field);
        Batch& zadd(const std::string& key, double score, const std::string& member);
        Batch& zrem(const std::string& key, const std::string& member);
        Batch& zremrangebyscore(const std::string& key, const std::string& min, const std::string& max);
        Batch& set(const std::string& key, const std::string& value);
        Batch& del(const std::string& key);

        const std::vector<CommandArgs>& commands() const { return cmds_; }
        bool empty() const { return cmds_.empty(); }
        std::size_t size() const { return cmds_.size(); }

    private:
        std::vector<CommandArgs> cmds_;
    };

    // Typed commands over one leased connection. Error replies throw
    // CommandError; transport failures throw StoreUnavailable.
    class Commands {
    public:
        explicit Commands(Connection& conn) : conn_(conn) {}

        std::string ping();
        long long dbsize();
        void flushdb();

        // hashes
        bool hexists(const std::string& key, const std::string& field);
        std::optional<std::string> hget(const std::string& key, const std::string& field);
        std::vector<std::pair<std::string, std::string>> hgetall(const std::string& key);
        std::vector<std::string> hkeys(const std::string& key);
        std::vector<std::optional<std::string>> hmget(const std::string& key, const std::vector<std::string>& fields);
        long long hset(const std::string& key, const std::string& field, const std::string& value);
        long long hdel(const std::string& key, const std::string& field);
        long long hlen(const std::string& key);

        // sorted sets
        long long zadd(const std::string& key, double score, const std::string& member);
        std::optional<double> zscore(const std::string& key, const std::string& member);
        std::vector<std::string> zrangebyscore(const std::string& key, const std::string& min, const std::string& max);
        long long zrem(const std::string& key, const std::string& member);
        long long zremrangebyscore(const std::string& key, const std::string& min, const std::string& max);

        // strings
        std::optional<std::string> get(const std::string& key);
        void set(const std::string& key, const std::string& value);
        long long incr(const std::string& key);
        long long del(const std::string& key);

        // optimistic concurrency
        void watch(const std::string& key);
        void unwatch();

        // MULTI + batch + EXEC in one round trip. nullopt when a watched key
        // changed and the store refused to apply the batch.
        std::optional<std::vector<RespValue>> exec(const Batch& batch);

        // Unordered-failure batch; replies are returned as-is (errors included).
        std::vector<RespValue> pipeline(const Batch& batch);

    private:
        RespValue call(const CommandArgs& args);

        Connection& conn_;
    };

    // Score argument for an epoch-millisecond expiry.
    std::string score_arg(double score);

} // namespace rcache
