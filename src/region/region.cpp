#include <rcache/region/region.hpp>
#include <rcache/time/timestamper.hpp>
#include <rcache/util/errors.hpp>
#include <rcache/util/log.hpp>

namespace rcache {

    Region::Region(RegionSettings settings, std::shared_ptr<StoreClient> client,
        const clock::Clock& clk, std::shared_ptr<Timestamper> timestamper)
        : settings_(std::move(settings))
        , client_(std::move(client))
        , clock_(clk)
        , timestamper_(std::move(timestamper)) {
        if (settings_.name.empty()) throw RegionStateError("region name must not be empty");
        if (!client_) throw RegionStateError("region '" + settings_.name + "' has no store client");
        hash_ = region_key(settings_.name);
        index_ = index_key(settings_.name);
    }

    std::optional<Value> Region::decode_or_miss(const std::string& key, const std::string& raw) const {
        try {
            return codec_.decode(raw);
        }
        catch (const SerializationError& e) {
            log::warnf("region", "{}: undecodable entry '{}' treated as a miss: {}", name(), key, e.what());
            return std::nullopt;
        }
    }

    void Region::cleanup(const std::vector<std::string>& keys) {
        client_->run_pipelined([&](Batch& b) {
            // hash entry before index entry, so a concurrent reader still finds the expired score
            for (auto& k : keys) {
                b.hdel(hash_, k);
                b.zrem(index_, k);
            }
        });
    }

    bool Region::exists(const std::string& key) {
        try {
            return client_->run([&](Commands& c) { return c.hexists(hash_, key); });
        }
        catch (const CacheError& e) {
            log::warnf("region", "{}: exists('{}') failed: {}", name(), key, e.what());
            return false;
        }
    }

    std::optional<Value> Region::get(const std::string& key, long long expiration_seconds) {
        const bool lazy = indexed() && expiration_seconds > 0;
        bool expired = false;
        std::optional<std::string> raw;
        try {
            raw = client_->run([&](Commands& c) -> std::optional<std::string> {
                clock::Millis now = clock_.now_ms();
                std::optional<double> expiry;
                if (lazy) {
                    expiry = c.zscore(index_, key);
                    if (expiry && clock::is_expired(static_cast<clock::Millis>(*expiry), now)) {
                        expired = true;
                        return std::nullopt;
                    }
                }
                auto v = c.hget(hash_, key);
                // only entries that already expire get their deadline slid
                if (v && expiry) c.zadd(index_, static_cast<double>(clock::expiry_after(now, expiration_seconds)), key);
                return v;
            });
        }
        catch (const CacheError& e) {
            log::warnf("region", "{}: get('{}') failed: {}", name(), key, e.what());
            return std::nullopt;
        }

        if (expired) {
            log::debugf("region", "{}: '{}' expired", name(), key);
            cleanup({ key });
            return std::nullopt;
        }
        if (!raw) return std::nullopt;
        return decode_or_miss(key, *raw);
    }

    std::optional<Value> Region::get(const std::string& key) {
        return get(key, settings_.expiryInSeconds);
    }

    std::vector<std::optional<Value>> Region::get_many(const std::vector<std::string>& keys) {
        std::vector<std::optional<Value>> out(keys.size());
        if (keys.empty()) return out;

        std::vector<std::optional<std::string>> raws;
        std::vector<std::string> expired;
        try {
            raws = client_->run([&](Commands& c) {
                auto values = c.hmget(hash_, keys);
                if (indexed()) {
                    clock::Millis now = clock_.now_ms();
                    for (size_t i = 0; i < values.size(); ++i) {
                        if (!values[i]) continue;
                        auto expiry = c.zscore(index_, keys[i]);
                        if (expiry && clock::is_expired(static_cast<clock::Millis>(*expiry), now)) {
                            values[i].reset();
                            expired.push_back(keys[i]);
                        }
                    }
                }
                return values;
            });
        }
        catch (const CacheError& e) {
            log::warnf("region", "{}: get_many of {} keys failed: {}", name(), keys.size(), e.what());
            return out;
        }

        for (size_t i = 0; i < raws.size() && i < out.size(); ++i) {
            if (raws[i]) out[i] = decode_or_miss(keys[i], *raws[i]);
        }
        if (!expired.empty()) cleanup(expired);
        return out;
    }

    void Region::put(const std::string& key, const Value& value, long long ttl_seconds) {
        std::string raw = codec_.encode(value);
        clock::Millis expiry = clock::expiry_after(clock_.now_ms(), ttl_seconds);

        auto tx = client_->run_transaction([&](Batch& b) {
            b.hset(hash_, key, raw);
            if (!indexed()) return;
            if (expiry > 0) b.zadd(index_, static_cast<double>(expiry), key);
            else b.zrem(index_, key);
        });
        if (!tx.committed) throw TransactionAborted(name() + ": put('" + key + "') was aborted");
        if (auto err = tx.first_error()) throw CommandError(name() + ": put('" + key + "') rejected: " + *err);
    }

    void Region::put(const std::string& key, const Value& value) {
        put(key, value, settings_.expiryInSeconds);
    }

    void Region::remove(const std::string& key) {
        remove_all({ key });
    }

    void Region::remove_all(const std::vector<std::string>& keys) {
        if (keys.empty()) return;
        auto tx = client_->run_transaction([&](Batch& b) {
            for (auto& k : keys) {
                b.hdel(hash_, k);
                b.zrem(index_, k);
            }
        });
        if (!tx.committed) throw TransactionAborted(name() + ": remove was aborted");
        if (auto err = tx.first_error()) throw CommandError(name() + ": remove rejected: " + *err);
    }

    std::vector<std::string> Region::keys() {
        try {
            return client_->run([&](Commands& c) { return c.hkeys(hash_); });
        }
        catch (const CacheError& e) {
            log::warnf("region", "{}: keys() failed: {}", name(), e.what());
            return {};
        }
    }

    long long Region::size() {
        try {
            return client_->run([&](Commands& c) { return c.hlen(hash_); });
        }
        catch (const CacheError& e) {
            log::warnf("region", "{}: size() failed: {}", name(), e.what());
            return -1;
        }
    }

    long long Region::size_in_store() {
        try {
            return client_->db_size();
        }
        catch (const CacheError& e) {
            log::warnf("region", "{}: size_in_store() failed: {}", name(), e.what());
            return -1;
        }
    }

    std::map<std::string, Value> Region::as_map() {
        std::vector<std::pair<std::string, std::string>> raw;
        try {
            raw = client_->run([&](Commands& c) { return c.hgetall(hash_); });
        }
        catch (const CacheError& e) {
            log::warnf("region", "{}: as_map() failed: {}", name(), e.what());
            return {};
        }

        std::map<std::string, Value> out;
        for (auto& [k, v] : raw) {
            if (auto decoded = decode_or_miss(k, v)) out.emplace(k, std::move(*decoded));
        }
        return out;
    }

    std::size_t Region::evict_expired() {
        std::string upper = score_arg(static_cast<double>(clock_.now_ms()));
        std::vector<std::string> expired;
        try {
            expired = client_->run([&](Commands& c) { return c.zrangebyscore(index_, "-inf", upper); });
        }
        catch (const CacheError& e) {
            log::warnf("region", "{}: listing expired entries failed: {}", name(), e.what());
            return 0;
        }
        if (expired.empty()) return 0;

        bool delivered = client_->run_pipelined([&](Batch& b) {
            for (auto& k : expired) b.hdel(hash_, k);
            b.zremrangebyscore(index_, "-inf", upper);
        });
        if (!delivered) return 0;
        log::debugf("region", "{}: evicted {} expired entries", name(), expired.size());
        return expired.size();
    }

    void Region::clear() {
        deleted_.store(true);
        log::infof("region", "{}: cleared (logical only, stored entries kept)", name());
    }

    void Region::destroy() {
        deleted_.store(true);
        log::infof("region", "{}: destroyed (logical only, stored entries kept)", name());
    }

    long long Region::next_timestamp() {
        if (!timestamper_) throw RegionStateError(name() + ": no timestamp generator attached");
        return timestamper_->next();
    }

} // namespace rcache
