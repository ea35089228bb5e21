#include <rcache/region/registry.hpp>
#include <mutex>

namespace rcache {

    bool RegionRegistry::add(const std::string& name) {
        std::unique_lock lk(mu_);
        return names_.insert(name).second;
    }

    bool RegionRegistry::contains(const std::string& name) const {
        std::shared_lock lk(mu_);
        return names_.count(name) != 0;
    }

    std::vector<std::string> RegionRegistry::snapshot() const {
        std::shared_lock lk(mu_);
        return { names_.begin(), names_.end() };
    }

    std::size_t RegionRegistry::size() const {
        std::shared_lock lk(mu_);
        return names_.size();
    }

} // namespace rcache
