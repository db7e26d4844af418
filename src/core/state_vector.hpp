#ifndef SKYSHIELD_STATE_VECTOR_HPP
#define SKYSHIELD_STATE_VECTOR_HPP

#include <cmath>

namespace skyshield {

/**
 * @brief Simple 3D vector in the local defense frame
 *
 * x/z span the ground plane, y is altitude above ground (meters).
 */
struct Vec3 {
    double x, y, z;

    Vec3() : x(0), y(0), z(0) {}
    Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    double norm() const {
        return std::sqrt(x*x + y*y + z*z);
    }

    double norm_squared() const {
        return x*x + y*y + z*z;
    }

    static Vec3 Zero() { return Vec3(0, 0, 0); }
};

} // namespace skyshield

#endif // SKYSHIELD_STATE_VECTOR_HPP
