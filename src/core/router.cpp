#include <rcache/core/router.hpp>
#include <rcache/proto/resp.hpp>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>

namespace rcache {

    static std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
        return s;
    }

    static std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    static inline std::string resp_wrongtype() {
        return resp_error_code("WRONGTYPE", "Operation against a key holding the wrong kind of value");
    }

    static ScoreBound bound_or_throw(const std::string& s) {
        auto b = parse_score_bound(s);
        if (!b) throw std::invalid_argument("min or max is not a float");
        return *b;
    }

    static std::string opt_bulk(const std::optional<std::string>& v) {
        return v ? resp_bulk(*v) : resp_nil();
    }

    Router::Router(Store& s) : store_(s) {
        add("PING", -1, [](auto const& a) {
            if (a.size() > 1) return resp_bulk(a[1]);
            return resp_simple("PONG");
            });

        add("ECHO", 2, [](auto const& a) { return resp_bulk(a[1]); });

        add("DBSIZE", 1, [this](auto const&) { return resp_int(store_.db_size()); });

        add("FLUSHDB", -1, [this](auto const&) {
            store_.flush_all();
            return resp_simple("OK");
            });

        // STRINGS

        add("GET", 2, [this](auto const& a) {
            return opt_bulk(store_.shard_for(a[1]).get(a[1]));
            });

        add("SET", 3, [this](auto const& a) {
            store_.shard_for(a[1]).set(a[1], a[2]);
            return resp_simple("OK");
            });

        add("INCR", 2, [this](auto const& a) {
            return resp_int(store_.shard_for(a[1]).incr_by(a[1], 1));
            });

        add("INCRBY", 3, [this](auto const& a) {
            long long delta = 0;
            try { delta = std::stoll(a[2]); }
            catch (const std::exception&) { return resp_error("value is not an integer or out of range"); }
            return resp_int(store_.shard_for(a[1]).incr_by(a[1], delta));
            });

        add("DEL", -2, [this](auto const& a) {
            long long n = 0;
            for (size_t i = 1; i < a.size(); ++i) {
                if (store_.shard_for(a[i]).del(a[i])) ++n;
            }
            return resp_int(n);
            });

        add("EXISTS", -2, [this](auto const& a) {
            long long count = 0;
            for (size_t i = 1; i < a.size(); ++i) {
                if (store_.shard_for(a[i]).type_of(a[i]) != ValueType::None) ++count;
            }
            return resp_int(count);
            });

        add("TYPE", 2, [this](auto const& a) {
            switch (store_.shard_for(a[1]).type_of(a[1])) {
            case ValueType::None:   return resp_simple("none");
            case ValueType::String: return resp_simple("string");
            case ValueType::Hash:   return resp_simple("hash");
            case ValueType::ZSet:   return resp_simple("zset");
            }
            return resp_simple("none");
            });

        // HASHES

        // HSET key field value [field value ...]
        add("HSET", -4, [this](auto const& a) {
            if ((a.size() - 2) % 2 != 0) return resp_error("wrong number of arguments for 'hset' command");
            auto& sh = store_.shard_for(a[1]);
            long long added = 0;
            for (size_t i = 2; i + 1 < a.size(); i += 2) {
                added += sh.hset(a[1], a[i], a[i + 1]);
            }
            return resp_int(added);
            });

        add("HGET", 3, [this](auto const& a) {
            return opt_bulk(store_.shard_for(a[1]).hget(a[1], a[2]));
            });

        // HDEL key field [field ...]
        add("HDEL", -3, [this](auto const& a) {
            auto& sh = store_.shard_for(a[1]);
            long long removed = 0;
            for (size_t i = 2; i < a.size(); ++i) removed += sh.hdel(a[1], a[i]);
            return resp_int(removed);
            });

        add("HEXISTS", 3, [this](auto const& a) {
            return resp_int(store_.shard_for(a[1]).hexists(a[1], a[2]));
            });

        add("HLEN", 2, [this](auto const& a) {
            return resp_int(store_.shard_for(a[1]).hlen(a[1]));
            });

        add("HGETALL", 2, [this](auto const& a) {
            return resp_array(store_.shard_for(a[1]).hgetall(a[1]), /*as_bulk=*/true);
            });

        add("HKEYS", 2, [this](auto const& a) {
            return resp_array(store_.shard_for(a[1]).hkeys(a[1]), /*as_bulk=*/true);
            });

        add("HMGET", -3, [this](auto const& a) {
            auto& sh = store_.shard_for(a[1]);
            std::vector<std::string> items;
            items.reserve(a.size() - 2);
            for (size_t i = 2; i < a.size(); ++i) items.push_back(opt_bulk(sh.hget(a[1], a[i])));
            return resp_array(items, /*as_bulk=*/false);
            });

        // SORTED SETS

        // ZADD key score member [score member ...]
        add("ZADD", -4, [this](auto const& a) {
            if ((a.size() - 2) % 2 != 0) return resp_error("syntax error");
            std::vector<std::pair<double, std::string>> pairs;
            for (size_t i = 2; i + 1 < a.size(); i += 2) {
                auto b = parse_score_bound(a[i]);
                if (!b || b->exclusive) return resp_error("value is not a valid float");
                pairs.emplace_back(b->value, a[i + 1]);
            }
            auto& sh = store_.shard_for(a[1]);
            long long added = 0;
            for (auto& [score, member] : pairs) added += sh.zadd(a[1], score, member);
            return resp_int(added);
            });

        add("ZSCORE", 3, [this](auto const& a) {
            auto s = store_.shard_for(a[1]).zscore(a[1], a[2]);
            if (!s) return resp_nil();
            return resp_bulk(format_score(*s));
            });

        add("ZRANGEBYSCORE", 4, [this](auto const& a) {
            auto members = store_.shard_for(a[1]).zrangebyscore(a[1], bound_or_throw(a[2]), bound_or_throw(a[3]));
            return resp_array(members, /*as_bulk=*/true);
            });

        // ZREM key member [member ...]
        add("ZREM", -3, [this](auto const& a) {
            auto& sh = store_.shard_for(a[1]);
            long long removed = 0;
            for (size_t i = 2; i < a.size(); ++i) removed += sh.zrem(a[1], a[i]);
            return resp_int(removed);
            });

        add("ZREMRANGEBYSCORE", 4, [this](auto const& a) {
            return resp_int(store_.shard_for(a[1]).zremrangebyscore(a[1], bound_or_throw(a[2]), bound_or_throw(a[3])));
            });
    }

    void Router::add(const std::string& name, int arity, Handler fn) {
        h_[name] = Command{ arity, std::move(fn) };
    }

    std::string Router::invoke(const Command& c, const std::vector<std::string>& args) {
        try {
            return c.fn(args);
        }
        catch (const WrongTypeError&) {
            return resp_wrongtype();
        }
        catch (const std::invalid_argument& e) {
            return resp_error(e.what());
        }
        catch (const std::overflow_error& e) {
            return resp_error(e.what());
        }
    }

    std::string Router::dispatch(ClientState& client, const std::vector<std::string>& args) {
        if (args.empty()) return resp_error("empty command");
        auto cmd = upper(args[0]);

        if (cmd == "MULTI") {
            if (client.in_multi) return resp_error("MULTI calls can not be nested");
            client.in_multi = true;
            return resp_simple("OK");
        }
        if (cmd == "EXEC") {
            return exec(client);
        }
        if (cmd == "DISCARD") {
            if (!client.in_multi) return resp_error("DISCARD without MULTI");
            client.reset_transaction();
            return resp_simple("OK");
        }
        if (cmd == "WATCH") {
            if (client.in_multi) return resp_error("WATCH inside MULTI is not allowed");
            if (args.size() < 2) return resp_error("wrong number of arguments for 'watch' command");
            std::shared_lock lk(store_.exec_mutex());
            for (size_t i = 1; i < args.size(); ++i) {
                client.watched.emplace_back(args[i], store_.version(args[i]));
            }
            return resp_simple("OK");
        }
        if (cmd == "UNWATCH") {
            client.watched.clear();
            return resp_simple("OK");
        }

        auto it = h_.find(cmd);
        if (it == h_.end()) {
            if (client.in_multi) client.dirty = true;
            return resp_error("unknown command '" + args[0] + "'");
        }
        const auto& c = it->second;
        auto argc = static_cast<int>(args.size());
        if ((c.arity > 0 && argc != c.arity) || (c.arity < 0 && argc < -c.arity)) {
            if (client.in_multi) client.dirty = true;
            return resp_error("wrong number of arguments for '" + lower(args[0]) + "' command");
        }

        if (client.in_multi) {
            client.queued.push_back(args);
            return resp_simple("QUEUED");
        }

        std::shared_lock lk(store_.exec_mutex());
        return invoke(c, args);
    }

    std::string Router::exec(ClientState& client) {
        if (!client.in_multi) return resp_error("EXEC without MULTI");
        if (client.dirty) {
            client.reset_transaction();
            return resp_error_code("EXECABORT", "Transaction discarded because of previous errors.");
        }

        std::unique_lock lk(store_.exec_mutex());
        for (auto& [key, version] : client.watched) {
            if (store_.version(key) != version) {
                client.reset_transaction();
                return resp_nil_array();
            }
        }

        std::vector<std::string> replies;
        replies.reserve(client.queued.size());
        for (auto& q : client.queued) {
            replies.push_back(invoke(h_.at(upper(q[0])), q));
        }
        client.reset_transaction();
        return resp_array(replies, /*as_bulk=*/false);
    }

} // namespace rcache
