/**
 * Battery - capability view of a defense site.
 *
 * The core only needs to know whether a battery can fire interceptors,
 * whether a threat is inside its envelope, and how to fire. Directed-
 * energy sites implement the reduced trait: they never fire interceptors
 * and are never allocated.
 */

#ifndef SKYSHIELD_DEFENSE_BATTERY_HPP
#define SKYSHIELD_DEFENSE_BATTERY_HPP

#include "defense/interceptor.hpp"
#include "defense/threat.hpp"
#include <functional>
#include <string>

namespace skyshield::defense {

enum class BatteryKind {
    LAUNCHER,
    LASER
};

const char* battery_kind_name(BatteryKind kind);

struct BatterySpec {
    std::string id;
    BatteryKind kind = BatteryKind::LAUNCHER;
    Vec3 position;
    double max_range = 2000.0;          // m
    double min_range = 4.0;             // m
    double interceptor_speed = 250.0;   // m/s
    int max_interceptors = 20;
    int interceptors = 20;              // available at start
    bool operational = true;
};

class Battery {
public:
    using LaunchCallback = std::function<void(Interceptor&&)>;

    explicit Battery(const BatterySpec& spec);
    virtual ~Battery() = default;

    const std::string& id() const { return spec_.id; }
    BatteryKind kind() const { return spec_.kind; }
    const Vec3& position() const { return spec_.position; }
    double max_range() const { return spec_.max_range; }
    double min_range() const { return spec_.min_range; }
    double interceptor_speed() const { return spec_.interceptor_speed; }
    int max_interceptors() const { return spec_.max_interceptors; }
    int available_interceptors() const { return available_; }

    bool operational() const { return operational_; }
    void set_operational(bool op) { operational_ = op; }

    virtual bool can_fire_interceptors() const = 0;

    /** Threat is live and inside this battery's engagement envelope. */
    virtual bool can_intercept(const Threat& threat) const = 0;

    /**
     * Fire up to count interceptors at the threat. Each launched round is
     * handed to on_launch. Inventory is decremented per round.
     * @return number actually fired
     */
    virtual int fire_interceptors(const Threat& threat, int count, double now,
                                  const LaunchCallback& on_launch) = 0;

protected:
    BatterySpec spec_;
    int available_;
    bool operational_;

    bool in_envelope(const Threat& threat) const;
};

/** Kinetic launcher: fires guided interceptors. */
class LauncherBattery : public Battery {
public:
    explicit LauncherBattery(const BatterySpec& spec) : Battery(spec) {}

    bool can_fire_interceptors() const override;
    bool can_intercept(const Threat& threat) const override;
    int fire_interceptors(const Threat& threat, int count, double now,
                          const LaunchCallback& on_launch) override;

private:
    int launch_counter_ = 0;
};

/** Directed-energy site: tracks but never fires interceptors. */
class LaserBattery : public Battery {
public:
    explicit LaserBattery(const BatterySpec& spec) : Battery(spec) {}

    bool can_fire_interceptors() const override { return false; }
    bool can_intercept(const Threat& threat) const override;
    int fire_interceptors(const Threat&, int, double, const LaunchCallback&) override { return 0; }
};

} // namespace skyshield::defense

#endif // SKYSHIELD_DEFENSE_BATTERY_HPP
