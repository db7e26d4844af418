#include "defense/assignment_ledger.hpp"
#include <algorithm>

namespace skyshield::defense {

void AssignmentLedger::assign(const std::string& threat_id, const std::string& battery_id,
                              int interceptor_count, double now) {
    entries_[threat_id] = Assignment{battery_id, interceptor_count, now};
}

bool AssignmentLedger::clear(const std::string& threat_id) {
    return entries_.erase(threat_id) > 0;
}

const Assignment* AssignmentLedger::find(const std::string& threat_id) const {
    auto it = entries_.find(threat_id);
    return it == entries_.end() ? nullptr : &it->second;
}

int AssignmentLedger::count(const std::string& threat_id) const {
    const Assignment* a = find(threat_id);
    return a ? a->interceptor_count : 0;
}

std::vector<std::string> AssignmentLedger::cleanup(double now, double max_age) {
    std::vector<std::string> dropped;
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        if (now - it->second.assigned_at > max_age) {
            dropped.push_back(it->first);
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    std::sort(dropped.begin(), dropped.end());
    return dropped;
}

std::vector<std::string> AssignmentLedger::threat_ids() const {
    std::vector<std::string> ids;
    ids.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) ids.push_back(id);
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace skyshield::defense
