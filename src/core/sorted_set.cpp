#include <rcache/core/sorted_set.hpp>

#include <cmath>
#include <cstdio>
#include <limits>
#include <set>
#include <unordered_map>

namespace rcache {

    std::optional<ScoreBound> parse_score_bound(const std::string& s) {
        if (s.empty()) return std::nullopt;
        ScoreBound b;
        std::size_t i = 0;
        if (s[0] == '(') { b.exclusive = true; i = 1; }
        std::string body = s.substr(i);
        if (body == "-inf") { b.value = -std::numeric_limits<double>::infinity(); return b; }
        if (body == "+inf" || body == "inf") { b.value = std::numeric_limits<double>::infinity(); return b; }
        try {
            std::size_t used = 0;
            b.value = std::stod(body, &used);
            if (used != body.size() || std::isnan(b.value)) return std::nullopt;
        }
        catch (const std::exception&) {
            return std::nullopt;
        }
        return b;
    }

    std::string format_score(double score) {
        if (std::isinf(score)) return score > 0 ? "inf" : "-inf";
        double ip = 0;
        if (std::modf(score, &ip) == 0.0 && std::fabs(score) < 9.007199254740992e15) {
            return std::to_string(static_cast<long long>(score));
        }
        char buf[32];
        std::snprintf(buf, sizeof buf, "%.17g", score);
        return buf;
    }

    // (score, member) ordered like a skiplist: by score, ties by member
    using Node = std::pair<double, std::string>;

    struct SortedSet::Impl {
        std::set<Node> ordered;
        std::unordered_map<std::string, double> scores;  // current score per member
    };

    SortedSet::SortedSet() : impl_(new Impl) {}
    SortedSet::~SortedSet() { delete impl_; }
    SortedSet::SortedSet(SortedSet&& o) noexcept : impl_(std::exchange(o.impl_, nullptr)) {}
    SortedSet& SortedSet::operator=(SortedSet&& o) noexcept {
        if (this != &o) { delete impl_; impl_ = std::exchange(o.impl_, nullptr); }
        return *this;
    }

    bool SortedSet::add(const std::string& member, double score) {
        auto& I = *impl_;
        auto it = I.scores.find(member);
        if (it != I.scores.end()) {
            if (it->second == score) return false;
            I.ordered.erase(Node{ it->second, member });
            it->second = score;
            I.ordered.emplace(score, member);
            return false;
        }
        I.scores.emplace(member, score);
        I.ordered.emplace(score, member);
        return true;
    }

    bool SortedSet::remove(const std::string& member) {
        auto& I = *impl_;
        auto it = I.scores.find(member);
        if (it == I.scores.end()) return false;
        I.ordered.erase(Node{ it->second, member });
        I.scores.erase(it);
        return true;
    }

    std::optional<double> SortedSet::score(const std::string& member) const {
        const auto& I = *impl_;
        auto it = I.scores.find(member);
        if (it == I.scores.end()) return std::nullopt;
        return it->second;
    }

    static bool above_min(double score, ScoreBound min) {
        return min.exclusive ? score > min.value : score >= min.value;
    }
    static bool below_max(double score, ScoreBound max) {
        return max.exclusive ? score < max.value : score <= max.value;
    }

    std::vector<std::string> SortedSet::range_by_score(ScoreBound min, ScoreBound max) const {
        const auto& I = *impl_;
        std::vector<std::string> out;
        // first node with score >= min.value; exclusive bounds are filtered below
        auto it = I.ordered.lower_bound(Node{ min.value, std::string() });
        for (; it != I.ordered.end(); ++it) {
            if (!below_max(it->first, max)) break;
            if (above_min(it->first, min)) out.push_back(it->second);
        }
        return out;
    }

    std::size_t SortedSet::remove_range_by_score(ScoreBound min, ScoreBound max) {
        auto& I = *impl_;
        std::size_t removed = 0;
        auto it = I.ordered.lower_bound(Node{ min.value, std::string() });
        while (it != I.ordered.end() && below_max(it->first, max)) {
            if (!above_min(it->first, min)) { ++it; continue; }
            I.scores.erase(it->second);
            it = I.ordered.erase(it);
            ++removed;
        }
        return removed;
    }

    std::size_t SortedSet::size() const {
        return impl_->scores.size();
    }

} // namespace rcache
