#include <rcache/client/commands.hpp>
#include <rcache/core/sorted_set.hpp>
#include <rcache/util/errors.hpp>
#include <stdexcept>

namespace rcache {

    std::string score_arg(double score) {
        return format_score(score);
    }

    // Batch

    Batch& Batch::hset(const std::string& key, const std::string& field, const std::string& value) {
        cmds_.push_back({ "HSET", key, field, value });
        return *this;
    }
    Batch& Batch::hdel(const std::string& key, const std::string& field) {
        cmds_.push_back({ "HDEL", key, field });
        return *this;
    }
    Batch& Batch::zadd(const std::string& key, double score, const std::string& member) {
        cmds_.push_back({ "ZADD", key, score_arg(score), member });
        return *this;
    }
    Batch& Batch::zrem(const std::string& key, const std::string& member) {
        cmds_.push_back({ "ZREM", key, member });
        return *this;
    }
    Batch& Batch::zremrangebyscore(const std::string& key, const std::string& min, const std::string& max) {
        cmds_.push_back({ "ZREMRANGEBYSCORE", key, min, max });
        return *this;
    }
    Batch& Batch::set(const std::string& key, const std::string& value) {
        cmds_.push_back({ "SET", key, value });
        return *this;
    }
    Batch& Batch::del(const std::string& key) {
        cmds_.push_back({ "DEL", key });
        return *this;
    }

    // reply shape helpers

    static const RespValue& checked(const RespValue& v, const CommandArgs& args) {
        if (v.is_error()) throw CommandError(args.empty() ? v.str : args[0] + ": " + v.str);
        return v;
    }

    static long long as_int(const RespValue& v, const CommandArgs& args) {
        if (v.type != RespValue::Type::Int) throw CommandError(args[0] + ": expected integer reply");
        return v.integer;
    }

    static std::optional<std::string> as_opt_bulk(const RespValue& v, const CommandArgs& args) {
        if (v.is_nil()) return std::nullopt;
        if (v.type != RespValue::Type::Bulk) throw CommandError(args[0] + ": expected bulk reply");
        return v.str;
    }

    static std::vector<std::string> as_bulk_list(const RespValue& v, const CommandArgs& args) {
        if (v.is_nil()) return {};
        if (!v.is_array()) throw CommandError(args[0] + ": expected array reply");
        std::vector<std::string> out;
        out.reserve(v.elements.size());
        for (auto& e : v.elements) out.push_back(e.str);
        return out;
    }

    RespValue Commands::call(const CommandArgs& args) {
        auto v = conn_.execute(args);
        checked(v, args);
        return v;
    }

    std::string Commands::ping() {
        return call({ "PING" }).str;
    }

    long long Commands::dbsize() {
        CommandArgs a{ "DBSIZE" };
        return as_int(call(a), a);
    }

    void Commands::flushdb() {
        call({ "FLUSHDB" });
    }

    bool Commands::hexists(const std::string& key, const std::string& field) {
        CommandArgs a{ "HEXISTS", key, field };
        return as_int(call(a), a) == 1;
    }

    std::optional<std::string> Commands::hget(const std::string& key, const std::string& field) {
        CommandArgs a{ "HGET", key, field };
        return as_opt_bulk(call(a), a);
    }

    std::vector<std::pair<std::string, std::string>> Commands::hgetall(const std::string& key) {
        CommandArgs a{ "HGETALL", key };
        auto flat = as_bulk_list(call(a), a);
        if (flat.size() % 2 != 0) throw CommandError("HGETALL: odd number of elements");
        std::vector<std::pair<std::string, std::string>> out;
        out.reserve(flat.size() / 2);
        for (size_t i = 0; i + 1 < flat.size(); i += 2) out.emplace_back(std::move(flat[i]), std::move(flat[i + 1]));
        return out;
    }

    std::vector<std::string> Commands::hkeys(const std::string& key) {
        CommandArgs a{ "HKEYS", key };
        return as_bulk_list(call(a), a);
    }

    std::vector<std::optional<std::string>> Commands::hmget(const std::string& key, const std::vector<std::string>& fields) {
        std::vector<std::optional<std::string>> out;
        if (fields.empty()) return out;
        CommandArgs a{ "HMGET", key };
        a.insert(a.end(), fields.begin(), fields.end());
        auto v = call(a);
        if (!v.is_array() || v.elements.size() != fields.size()) throw CommandError("HMGET: unexpected reply shape");
        out.reserve(fields.size());
        for (auto& e : v.elements) out.push_back(as_opt_bulk(e, a));
        return out;
    }

    long long Commands::hset(const std::string& key, const std::string& field, const std::string& value) {
        CommandArgs a{ "HSET", key, field, value };
        return as_int(call(a), a);
    }

    long long Commands::hdel(const std::string& key, const std::string& field) {
        CommandArgs a{ "HDEL", key, field };
        return as_int(call(a), a);
    }

    long long Commands::hlen(const std::string& key) {
        CommandArgs a{ "HLEN", key };
        return as_int(call(a), a);
    }

    long long Commands::zadd(const std::string& key, double score, const std::string& member) {
        CommandArgs a{ "ZADD", key, score_arg(score), member };
        return as_int(call(a), a);
    }

    std::optional<double> Commands::zscore(const std::string& key, const std::string& member) {
        CommandArgs a{ "ZSCORE", key, member };
        auto s = as_opt_bulk(call(a), a);
        if (!s) return std::nullopt;
        auto b = parse_score_bound(*s);
        if (!b) throw CommandError("ZSCORE: unparsable score '" + *s + "'");
        return b->value;
    }

    std::vector<std::string> Commands::zrangebyscore(const std::string& key, const std::string& min, const std::string& max) {
        CommandArgs a{ "ZRANGEBYSCORE", key, min, max };
        return as_bulk_list(call(a), a);
    }

    long long Commands::zrem(const std::string& key, const std::string& member) {
        CommandArgs a{ "ZREM", key, member };
        return as_int(call(a), a);
    }

    long long Commands::zremrangebyscore(const std::string& key, const std::string& min, const std::string& max) {
        CommandArgs a{ "ZREMRANGEBYSCORE", key, min, max };
        return as_int(call(a), a);
    }

    std::optional<std::string> Commands::get(const std::string& key) {
        CommandArgs a{ "GET", key };
        return as_opt_bulk(call(a), a);
    }

    void Commands::set(const std::string& key, const std::string& value) {
        call({ "SET", key, value });
    }

    long long Commands::incr(const std::string& key) {
        CommandArgs a{ "INCR", key };
        return as_int(call(a), a);
    }

    long long Commands::del(const std::string& key) {
        CommandArgs a{ "DEL", key };
        return as_int(call(a), a);
    }

    void Commands::watch(const std::string& key) {
        call({ "WATCH", key });
    }

    void Commands::unwatch() {
        call({ "UNWATCH" });
    }

    std::optional<std::vector<RespValue>> Commands::exec(const Batch& batch) {
        std::vector<CommandArgs> wire;
        wire.reserve(batch.size() + 2);
        wire.push_back({ "MULTI" });
        for (auto& c : batch.commands()) wire.push_back(c);
        wire.push_back({ "EXEC" });

        auto replies = conn_.execute_batch(wire);
        if (replies.size() != wire.size()) throw CommandError("EXEC: reply count mismatch");

        checked(replies.front(), wire.front());
        // a rejected queued command makes EXEC answer EXECABORT; report the cause
        for (size_t i = 1; i + 1 < replies.size(); ++i) {
            if (replies[i].is_error()) throw CommandError(wire[i][0] + ": " + replies[i].str);
        }
        auto& result = checked(replies.back(), wire.back());
        if (result.is_nil()) return std::nullopt;
        if (!result.is_array()) throw CommandError("EXEC: expected array reply");
        return result.elements;
    }

    std::vector<RespValue> Commands::pipeline(const Batch& batch) {
        if (batch.empty()) return {};
        return conn_.execute_batch(batch.commands());
    }

} // namespace rcache
