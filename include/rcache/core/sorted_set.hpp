#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace rcache {

    // Score bound for range queries; `exclusive` mirrors the "(" prefix.
    struct ScoreBound {
        double value = 0;
        bool exclusive = false;

        static ScoreBound inclusive(double v) { return { v, false }; }
    };

    // Parses "-inf", "+inf", "inf", "1.5", "(1.5". Returns nullopt if malformed.
    std::optional<ScoreBound> parse_score_bound(const std::string& s);

    // Formats a score the way replies carry it ("1700000000000", "1.5").
    std::string format_score(double score);

    // ---- Score-ordered member set (PIMPL; owner provides locking) -------------

    class SortedSet {
    public:
        SortedSet();
        ~SortedSet();
        SortedSet(const SortedSet&) = delete;
        SortedSet& operator=(const SortedSet&) = delete;
        SortedSet(SortedSet&&) noexcept;
        SortedSet& operator=(SortedSet&&) noexcept;

        // add or move member to score; true if the member is new
        bool add(const std::string& member, double score);

        // true if the member existed
        bool remove(const std::string& member);

        std::optional<double> score(const std::string& member) const;

        // Members with min <= score <= max (bounds may be exclusive), ascending.
        std::vector<std::string> range_by_score(ScoreBound min, ScoreBound max) const;

        // Remove members in range; returns how many were removed.
        std::size_t remove_range_by_score(ScoreBound min, ScoreBound max);

        std::size_t size() const;
        bool empty() const { return size() == 0; }

    private:
        struct Impl;           // opaque implementation
        Impl* impl_{ nullptr };
    };

} // namespace rcache
