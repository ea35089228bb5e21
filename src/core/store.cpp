#include <rcache/core/store.hpp>
#include <functional>
#include <limits>
#include <memory>
#include <mutex>

namespace rcache {

    ValueType Shard::type_of_unlocked(const std::string& key) const {
        if (map_.find(key) != map_.end())  return ValueType::String;
        if (hmap_.find(key) != hmap_.end()) return ValueType::Hash;
        if (zmap_.find(key) != zmap_.end()) return ValueType::ZSet;
        return ValueType::None;
    }

    void Shard::expect_type_unlocked(const std::string& key, ValueType want) const {
        auto t = type_of_unlocked(key);
        if (t != ValueType::None && t != want) throw WrongTypeError();
    }

    // STRINGS

    std::optional<std::string> Shard::get(const std::string& k) {
        std::shared_lock lk(mu_);
        expect_type_unlocked(k, ValueType::String);
        auto it = map_.find(k);
        if (it == map_.end()) return std::nullopt;
        return it->second;
    }

    void Shard::set(const std::string& k, std::string v) {
        std::unique_lock lk(mu_);
        // SET overwrites whatever type the key held
        hmap_.erase(k);
        zmap_.erase(k);
        map_[k] = std::move(v);
        touch_unlocked(k);
    }

    long long Shard::incr_by(const std::string& k, long long delta) {
        std::unique_lock lk(mu_);
        expect_type_unlocked(k, ValueType::String);
        long long cur = 0;
        auto it = map_.find(k);
        if (it != map_.end()) {
            std::size_t used = 0;
            try {
                cur = std::stoll(it->second, &used, 10);
            }
            catch (const std::exception&) {
                throw std::invalid_argument("value is not an integer or out of range");
            }
            if (used != it->second.size()) throw std::invalid_argument("value is not an integer or out of range");
        }
        if ((delta > 0 && cur > std::numeric_limits<long long>::max() - delta) ||
            (delta < 0 && cur < std::numeric_limits<long long>::min() - delta)) {
            throw std::overflow_error("increment or decrement would overflow");
        }
        cur += delta;
        map_[k] = std::to_string(cur);
        touch_unlocked(k);
        return cur;
    }

    bool Shard::del(const std::string& k) {
        std::unique_lock lk(mu_);
        bool s = map_.erase(k) > 0;
        bool h = hmap_.erase(k) > 0;
        bool z = zmap_.erase(k) > 0;
        if (s || h || z) touch_unlocked(k);
        return s || h || z;
    }

    // Hashes

    int Shard::hset(const std::string& key, const std::string& field, const std::string& value) {
        std::unique_lock lk(mu_);
        expect_type_unlocked(key, ValueType::Hash);
        auto& hm = hmap_[key];
        touch_unlocked(key);
        auto it = hm.find(field);
        if (it == hm.end()) { hm.emplace(field, value); return 1; }
        it->second = value; return 0;
    }

    std::optional<std::string> Shard::hget(const std::string& key, const std::string& field) {
        std::shared_lock lk(mu_);
        expect_type_unlocked(key, ValueType::Hash);
        auto kh = hmap_.find(key);
        if (kh == hmap_.end()) return std::nullopt;
        auto it = kh->second.find(field);
        if (it == kh->second.end()) return std::nullopt;
        return it->second;
    }

    int Shard::hdel(const std::string& key, const std::string& field) {
        std::unique_lock lk(mu_);
        expect_type_unlocked(key, ValueType::Hash);
        auto kh = hmap_.find(key);
        if (kh == hmap_.end()) return 0;
        int removed = (int)(kh->second.erase(field) > 0);
        if (kh->second.empty()) {
            hmap_.erase(kh);
        }
        if (removed) touch_unlocked(key);
        return removed;
    }

    int Shard::hexists(const std::string& key, const std::string& field) {
        std::shared_lock lk(mu_);
        expect_type_unlocked(key, ValueType::Hash);
        auto kh = hmap_.find(key);
        if (kh == hmap_.end()) return 0;
        return kh->second.count(field) ? 1 : 0;
    }

    long long Shard::hlen(const std::string& key) {
        std::shared_lock lk(mu_);
        expect_type_unlocked(key, ValueType::Hash);
        auto kh = hmap_.find(key);
        if (kh == hmap_.end()) return 0;
        return static_cast<long long>(kh->second.size());
    }

    std::vector<std::string> Shard::hgetall(const std::string& key) {
        std::shared_lock lk(mu_);
        expect_type_unlocked(key, ValueType::Hash);
        std::vector<std::string> out;
        auto kh = hmap_.find(key);
        if (kh == hmap_.end()) return out;
        out.reserve(kh->second.size() * 2);
        for (auto& [f, v] : kh->second) {
            out.push_back(f);
            out.push_back(v);
        }
        return out;
    }

    std::vector<std::string> Shard::hkeys(const std::string& key) {
        std::shared_lock lk(mu_);
        expect_type_unlocked(key, ValueType::Hash);
        std::vector<std::string> out;
        auto kh = hmap_.find(key);
        if (kh == hmap_.end()) return out;
        out.reserve(kh->second.size());
        for (auto& kv : kh->second) out.push_back(kv.first);
        return out;
    }

    // Sorted sets

    int Shard::zadd(const std::string& key, double score, const std::string& member) {
        std::unique_lock lk(mu_);
        expect_type_unlocked(key, ValueType::ZSet);
        auto& zs = zmap_[key];
        touch_unlocked(key);
        return zs.add(member, score) ? 1 : 0;
    }

    std::optional<double> Shard::zscore(const std::string& key, const std::string& member) {
        std::shared_lock lk(mu_);
        expect_type_unlocked(key, ValueType::ZSet);
        auto kz = zmap_.find(key);
        if (kz == zmap_.end()) return std::nullopt;
        return kz->second.score(member);
    }

    std::vector<std::string> Shard::zrangebyscore(const std::string& key, ScoreBound min, ScoreBound max) {
        std::shared_lock lk(mu_);
        expect_type_unlocked(key, ValueType::ZSet);
        auto kz = zmap_.find(key);
        if (kz == zmap_.end()) return {};
        return kz->second.range_by_score(min, max);
    }

    int Shard::zrem(const std::string& key, const std::string& member) {
        std::unique_lock lk(mu_);
        expect_type_unlocked(key, ValueType::ZSet);
        auto kz = zmap_.find(key);
        if (kz == zmap_.end()) return 0;
        bool removed = kz->second.remove(member);
        if (kz->second.empty()) zmap_.erase(kz);
        if (removed) touch_unlocked(key);
        return removed ? 1 : 0;
    }

    long long Shard::zremrangebyscore(const std::string& key, ScoreBound min, ScoreBound max) {
        std::unique_lock lk(mu_);
        expect_type_unlocked(key, ValueType::ZSet);
        auto kz = zmap_.find(key);
        if (kz == zmap_.end()) return 0;
        auto n = kz->second.remove_range_by_score(min, max);
        if (kz->second.empty()) zmap_.erase(kz);
        if (n > 0) touch_unlocked(key);
        return static_cast<long long>(n);
    }

    ValueType Shard::type_of(const std::string& key) {
        std::shared_lock lk(mu_);
        return type_of_unlocked(key);
    }

    std::uint64_t Shard::version(const std::string& key) const {
        std::shared_lock lk(mu_);
        auto it = versions_.find(key);
        return it == versions_.end() ? 0 : it->second;
    }

    std::size_t Shard::key_count() const {
        std::shared_lock lk(mu_);
        return map_.size() + hmap_.size() + zmap_.size();
    }

    void Shard::flush() {
        std::unique_lock lk(mu_);
        for (auto& kv : map_) touch_unlocked(kv.first);
        for (auto& kv : hmap_) touch_unlocked(kv.first);
        for (auto& kv : zmap_) touch_unlocked(kv.first);
        map_.clear();
        hmap_.clear();
        zmap_.clear();
    }

    // Store

    Store::Store(size_t n) {
        if (n == 0) n = 1;
        shards_.reserve(n);
        for (size_t i = 0; i < n; ++i) {
            shards_.push_back(std::make_unique<Shard>());
        }
    }

    Shard& Store::shard_for(const std::string& key) {
        size_t h = std::hash<std::string>{}(key);
        return *shards_[h % shards_.size()];
    }

    long long Store::db_size() const {
        long long n = 0;
        for (auto& s : shards_) n += static_cast<long long>(s->key_count());
        return n;
    }

    void Store::flush_all() {
        for (auto& s : shards_) s->flush();
    }

    std::uint64_t Store::version(const std::string& key) {
        return shard_for(key).version(key);
    }

} // namespace rcache
