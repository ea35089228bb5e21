#pragma once
#include <cstddef>
#include <set>
#include <shared_mutex>
#include <string>
#include <vector>

namespace rcache {

    // Append-only set of region names the sweeper walks. Names are never
    // removed, even when their region is logically deleted.
    class RegionRegistry {
    public:
        // Returns false when the name was already registered.
        bool add(const std::string& name);
        bool contains(const std::string& name) const;
        std::vector<std::string> snapshot() const;
        std::size_t size() const;

    private:
        mutable std::shared_mutex mu_;
        std::set<std::string> names_;
    };

} // namespace rcache
