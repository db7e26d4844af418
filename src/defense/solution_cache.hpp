/**
 * SolutionCache - memoized intercept solutions per (threat, battery).
 *
 * Infeasible results are cached too (empty solution). Entries expire
 * after the TTL; once the cache grows past capacity the oldest entries
 * are evicted in one batch.
 */

#ifndef SKYSHIELD_DEFENSE_SOLUTION_CACHE_HPP
#define SKYSHIELD_DEFENSE_SOLUTION_CACHE_HPP

#include "core/state_vector.hpp"
#include <optional>
#include <string>
#include <unordered_map>

namespace skyshield::defense {

struct InterceptSolution {
    Vec3 point;
    double time = 0.0;   // s from now until the interceptor reaches point
};

struct CachedSolution {
    std::optional<InterceptSolution> solution;   // empty = infeasible
    double timestamp = 0.0;
};

class SolutionCache {
public:
    SolutionCache(double ttl, size_t capacity, size_t evict_count);

    /** Entry younger than the TTL, or nullptr. */
    const CachedSolution* lookup(const std::string& threat_id,
                                 const std::string& battery_id,
                                 double now) const;

    void store(const std::string& threat_id, const std::string& battery_id,
               const std::optional<InterceptSolution>& solution, double now);

    /** Remove every entry for a threat. */
    void invalidate(const std::string& threat_id);

    void clear() { entries_.clear(); }
    size_t size() const { return entries_.size(); }
    double ttl() const { return ttl_; }

private:
    double ttl_;
    size_t capacity_;
    size_t evict_count_;
    std::unordered_map<std::string, CachedSolution> entries_;

    static std::string make_key(const std::string& threat_id, const std::string& battery_id);
    void evict_oldest();
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_SOLUTION_CACHE_HPP
