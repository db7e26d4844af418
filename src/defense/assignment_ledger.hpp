/**
 * AssignmentLedger - which battery has committed how many rounds to which
 * threat. One entry per threat; entries are cleared on kill, on engagement
 * completion and by the consistency sweep.
 */

#ifndef SKYSHIELD_DEFENSE_ASSIGNMENT_LEDGER_HPP
#define SKYSHIELD_DEFENSE_ASSIGNMENT_LEDGER_HPP

#include <string>
#include <unordered_map>
#include <vector>

namespace skyshield::defense {

struct Assignment {
    std::string battery_id;
    int interceptor_count = 0;
    double assigned_at = 0.0;
};

class AssignmentLedger {
public:
    /** Record (or replace) the assignment for a threat. */
    void assign(const std::string& threat_id, const std::string& battery_id,
                int interceptor_count, double now);

    /** @return true if an entry was removed */
    bool clear(const std::string& threat_id);

    const Assignment* find(const std::string& threat_id) const;
    bool contains(const std::string& threat_id) const { return entries_.count(threat_id) > 0; }

    /** Interceptors committed to a threat, 0 when unassigned. */
    int count(const std::string& threat_id) const;

    /**
     * Drop entries older than max_age.
     * @return ids of the threats whose entries were dropped
     */
    std::vector<std::string> cleanup(double now, double max_age);

    std::vector<std::string> threat_ids() const;
    size_t size() const { return entries_.size(); }

private:
    std::unordered_map<std::string, Assignment> entries_;
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_ASSIGNMENT_LEDGER_HPP
