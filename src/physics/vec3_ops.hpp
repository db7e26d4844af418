/**
 * Vec3 Operations
 *
 * Free-function operator overloads and utilities for Vec3.
 * Header-only; x/z span the ground plane, y is up.
 */

#ifndef SKYSHIELD_VEC3_OPS_HPP
#define SKYSHIELD_VEC3_OPS_HPP

#include "core/state_vector.hpp"
#include <cmath>

namespace skyshield {

constexpr double GRAVITY = 9.81;  // m/s^2

// ═══════════════════════════════════════════════════════════════
// Vec3 operators
// ═══════════════════════════════════════════════════════════════

inline Vec3 operator+(const Vec3& a, const Vec3& b) {
    return Vec3{a.x + b.x, a.y + b.y, a.z + b.z};
}

inline Vec3 operator-(const Vec3& a, const Vec3& b) {
    return Vec3{a.x - b.x, a.y - b.y, a.z - b.z};
}

inline Vec3 operator-(const Vec3& a) {
    return Vec3{-a.x, -a.y, -a.z};
}

inline Vec3 operator*(double s, const Vec3& v) {
    return Vec3{s * v.x, s * v.y, s * v.z};
}

inline Vec3 operator*(const Vec3& v, double s) {
    return Vec3{v.x * s, v.y * s, v.z * s};
}

inline Vec3 operator/(const Vec3& v, double s) {
    double inv = 1.0 / s;
    return Vec3{v.x * inv, v.y * inv, v.z * inv};
}

inline Vec3& operator+=(Vec3& a, const Vec3& b) {
    a.x += b.x; a.y += b.y; a.z += b.z;
    return a;
}

inline Vec3& operator-=(Vec3& a, const Vec3& b) {
    a.x -= b.x; a.y -= b.y; a.z -= b.z;
    return a;
}

// ═══════════════════════════════════════════════════════════════
// Vec3 functions
// ═══════════════════════════════════════════════════════════════

inline double dot(const Vec3& a, const Vec3& b) {
    return a.x * b.x + a.y * b.y + a.z * b.z;
}

inline Vec3 cross(const Vec3& a, const Vec3& b) {
    return Vec3{
        a.y * b.z - a.z * b.y,
        a.z * b.x - a.x * b.z,
        a.x * b.y - a.y * b.x
    };
}

inline Vec3 normalized(const Vec3& v) {
    double n = v.norm();
    if (n < 1e-15) return Vec3::Zero();
    double inv = 1.0 / n;
    return Vec3{v.x * inv, v.y * inv, v.z * inv};
}

inline double distance(const Vec3& a, const Vec3& b) {
    return (a - b).norm();
}

// Scale v down so its magnitude does not exceed max_norm
inline Vec3 clamp_norm(const Vec3& v, double max_norm) {
    double n = v.norm();
    if (n <= max_norm || n < 1e-15) return v;
    return v * (max_norm / n);
}

// Constant-acceleration propagation: p + v*t + 0.5*a*t^2
inline Vec3 project(const Vec3& p, const Vec3& v, const Vec3& a, double t) {
    return p + v * t + a * (0.5 * t * t);
}

inline Vec3 gravity_vector() {
    return Vec3{0.0, -GRAVITY, 0.0};
}

}  // namespace skyshield

#endif  // SKYSHIELD_VEC3_OPS_HPP
