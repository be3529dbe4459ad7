/**
 * @file types.hpp
 * @brief Core domain types for deflectsim.
 * @author Watosn
 */
#pragma once

#include <cmath>
#include <cstdint>

namespace deflectsim::core {

/**
 * @brief Standard status code used by model outputs.
 */
enum class Status : std::uint8_t { Ok, InvalidInput, NotImplemented };

/**
 * @brief Cartesian 3-vector in scene units.
 */
struct Vec3 {
  double x{};
  double y{};
  double z{};
};

inline Vec3 operator+(const Vec3& a, const Vec3& b) { return Vec3{a.x + b.x, a.y + b.y, a.z + b.z}; }
inline Vec3 operator-(const Vec3& a, const Vec3& b) { return Vec3{a.x - b.x, a.y - b.y, a.z - b.z}; }
inline Vec3 operator*(double s, const Vec3& v) { return Vec3{s * v.x, s * v.y, s * v.z}; }
inline Vec3 operator*(const Vec3& v, double s) { return s * v; }
inline Vec3 operator/(const Vec3& v, double s) { return Vec3{v.x / s, v.y / s, v.z / s}; }
inline Vec3& operator+=(Vec3& a, const Vec3& b) {
  a.x += b.x;
  a.y += b.y;
  a.z += b.z;
  return a;
}
inline bool operator==(const Vec3& a, const Vec3& b) { return a.x == b.x && a.y == b.y && a.z == b.z; }
inline bool operator!=(const Vec3& a, const Vec3& b) { return !(a == b); }

inline double dot(const Vec3& a, const Vec3& b) { return a.x * b.x + a.y * b.y + a.z * b.z; }
inline double norm(const Vec3& v) { return std::sqrt(dot(v, v)); }

/**
 * @brief Snapshot of the asteroid as seen by the renderer.
 *
 * `world_position_m` is always `base_position_m + deflection_offset_m`.
 */
struct AsteroidState {
  Vec3 base_position_m{};
  Vec3 deflection_offset_m{};
  Vec3 world_position_m{};
  bool visible{true};
};

}  // namespace deflectsim::core
