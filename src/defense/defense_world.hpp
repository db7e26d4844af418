/**
 * DefenseWorld - container for threats, interceptors and batteries.
 *
 * Threats and interceptors live in contiguous vectors with an id index
 * for O(1) lookup. Batteries are polymorphic and held by unique_ptr.
 * Pointers returned by the getters are invalidated by add_* and purge_*.
 */

#ifndef SKYSHIELD_DEFENSE_DEFENSE_WORLD_HPP
#define SKYSHIELD_DEFENSE_DEFENSE_WORLD_HPP

#include "defense/battery.hpp"
#include "defense/interceptor.hpp"
#include "defense/sim_rng.hpp"
#include "defense/threat.hpp"
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace skyshield::defense {

class DefenseWorld {
public:
    DefenseWorld() = default;
    DefenseWorld(const DefenseWorld&) = delete;
    DefenseWorld& operator=(const DefenseWorld&) = delete;
    DefenseWorld(DefenseWorld&&) = default;
    DefenseWorld& operator=(DefenseWorld&&) = default;

    // ── Threats ──
    Threat& add_threat(Threat&& threat);
    Threat* get_threat(const std::string& id);
    const Threat* get_threat(const std::string& id) const;
    std::vector<Threat>& threats() { return threats_; }
    const std::vector<Threat>& threats() const { return threats_; }

    // ── Interceptors ──
    Interceptor& add_interceptor(Interceptor&& interceptor);
    Interceptor* get_interceptor(const std::string& id);
    const Interceptor* get_interceptor(const std::string& id) const;
    std::vector<Interceptor>& interceptors() { return interceptors_; }
    const std::vector<Interceptor>& interceptors() const { return interceptors_; }

    /** Active interceptors whose target is threat_id. */
    int interceptors_targeting(const std::string& threat_id) const;
    int active_interceptor_count() const;

    /** Drop inactive interceptors and rebuild the index. */
    void purge_inactive_interceptors();

    // ── Batteries ──
    Battery& add_battery(std::unique_ptr<Battery> battery);
    Battery* get_battery(const std::string& id);
    const Battery* get_battery(const std::string& id) const;
    std::vector<std::unique_ptr<Battery>>& batteries() { return batteries_; }
    const std::vector<std::unique_ptr<Battery>>& batteries() const { return batteries_; }

    double sim_time = 0.0;
    SimRNG rng{42};

private:
    std::vector<Threat> threats_;
    std::unordered_map<std::string, size_t> threat_index_;

    std::vector<Interceptor> interceptors_;
    std::unordered_map<std::string, size_t> interceptor_index_;

    std::vector<std::unique_ptr<Battery>> batteries_;
    std::unordered_map<std::string, size_t> battery_index_;
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_DEFENSE_WORLD_HPP
