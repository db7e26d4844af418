#include "defense/solution_cache.hpp"
#include <algorithm>
#include <vector>

namespace skyshield::defense {

SolutionCache::SolutionCache(double ttl, size_t capacity, size_t evict_count)
    : ttl_(ttl), capacity_(capacity), evict_count_(evict_count) {}

std::string SolutionCache::make_key(const std::string& threat_id, const std::string& battery_id) {
    return threat_id + '|' + battery_id;
}

const CachedSolution* SolutionCache::lookup(const std::string& threat_id,
                                            const std::string& battery_id,
                                            double now) const {
    auto it = entries_.find(make_key(threat_id, battery_id));
    if (it == entries_.end()) return nullptr;
    if (now - it->second.timestamp > ttl_) return nullptr;
    return &it->second;
}

void SolutionCache::store(const std::string& threat_id, const std::string& battery_id,
                          const std::optional<InterceptSolution>& solution, double now) {
    entries_[make_key(threat_id, battery_id)] = CachedSolution{solution, now};
    if (entries_.size() > capacity_) evict_oldest();
}

void SolutionCache::invalidate(const std::string& threat_id) {
    std::string prefix = threat_id + '|';
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (it->first.compare(0, prefix.size(), prefix) == 0) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

void SolutionCache::evict_oldest() {
    std::vector<std::pair<double, std::string>> by_age;
    by_age.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        by_age.emplace_back(entry.timestamp, key);
    }

    size_t n = std::min(evict_count_, by_age.size());
    std::partial_sort(by_age.begin(), by_age.begin() + static_cast<std::ptrdiff_t>(n), by_age.end());
    for (size_t i = 0; i < n; ++i) {
        entries_.erase(by_age[i].second);
    }
}

} // namespace skyshield::defense
