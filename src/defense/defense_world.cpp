#include "defense/defense_world.hpp"
#include <algorithm>

namespace skyshield::defense {

namespace {

template <typename T, typename Index>
T* lookup(std::vector<T>& items, const Index& index, const std::string& id) {
    auto it = index.find(id);
    if (it == index.end()) return nullptr;
    return &items[it->second];
}

} // namespace

Threat& DefenseWorld::add_threat(Threat&& threat) {
    threat_index_[threat.id] = threats_.size();
    threats_.push_back(std::move(threat));
    return threats_.back();
}

Threat* DefenseWorld::get_threat(const std::string& id) {
    return lookup(threats_, threat_index_, id);
}

const Threat* DefenseWorld::get_threat(const std::string& id) const {
    auto it = threat_index_.find(id);
    return it == threat_index_.end() ? nullptr : &threats_[it->second];
}

Interceptor& DefenseWorld::add_interceptor(Interceptor&& interceptor) {
    interceptor_index_[interceptor.id] = interceptors_.size();
    interceptors_.push_back(std::move(interceptor));
    return interceptors_.back();
}

Interceptor* DefenseWorld::get_interceptor(const std::string& id) {
    return lookup(interceptors_, interceptor_index_, id);
}

const Interceptor* DefenseWorld::get_interceptor(const std::string& id) const {
    auto it = interceptor_index_.find(id);
    return it == interceptor_index_.end() ? nullptr : &interceptors_[it->second];
}

int DefenseWorld::interceptors_targeting(const std::string& threat_id) const {
    return static_cast<int>(std::count_if(interceptors_.begin(), interceptors_.end(),
        [&](const Interceptor& i) { return i.active && i.target_id == threat_id; }));
}

int DefenseWorld::active_interceptor_count() const {
    return static_cast<int>(std::count_if(interceptors_.begin(), interceptors_.end(),
        [](const Interceptor& i) { return i.active; }));
}

void DefenseWorld::purge_inactive_interceptors() {
    interceptors_.erase(
        std::remove_if(interceptors_.begin(), interceptors_.end(),
                       [](const Interceptor& i) { return !i.active; }),
        interceptors_.end());

    interceptor_index_.clear();
    for (size_t i = 0; i < interceptors_.size(); ++i) {
        interceptor_index_[interceptors_[i].id] = i;
    }
}

Battery& DefenseWorld::add_battery(std::unique_ptr<Battery> battery) {
    battery_index_[battery->id()] = batteries_.size();
    batteries_.push_back(std::move(battery));
    return *batteries_.back();
}

Battery* DefenseWorld::get_battery(const std::string& id) {
    auto it = battery_index_.find(id);
    return it == battery_index_.end() ? nullptr : batteries_[it->second].get();
}

const Battery* DefenseWorld::get_battery(const std::string& id) const {
    auto it = battery_index_.find(id);
    return it == battery_index_.end() ? nullptr : batteries_[it->second].get();
}

} // namespace skyshield::defense
