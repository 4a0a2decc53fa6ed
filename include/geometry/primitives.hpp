#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

namespace nerfgrid::geometry {

// ── Axis-aligned box (xmin, ymin, zmin, xmax, ymax, zmax) ──────────────────
struct Aabb {
  glm::vec3 min{-1.f};
  glm::vec3 max{ 1.f};

  static Aabb cube(float halfExtent) {
    return Aabb{glm::vec3(-halfExtent), glm::vec3(halfExtent)};
  }

  std::array<float, 6> toArray() const {
    return {min.x, min.y, min.z, max.x, max.y, max.z};
  }
  static Aabb fromArray(const std::array<float, 6>& a) {
    return Aabb{glm::vec3(a[0], a[1], a[2]), glm::vec3(a[3], a[4], a[5])};
  }

  glm::vec3 clip(const glm::vec3& p) const { return glm::min(glm::max(p, min), max); }
};

// ── Pinhole intrinsics ─────────────────────────────────────────────────────
struct Intrinsics {
  float fx, fy, cx, cy;
};

// ── Ray batch (structure of arrays) ────────────────────────────────────────
// directions need not be unit length; directionNorms convert the parametric
// depth along a ray into the reported depth.
struct RayBatch {
  std::vector<glm::vec3> origins;
  std::vector<glm::vec3> directions;
  std::vector<float>     directionNorms;

  std::size_t size() const { return origins.size(); }

  // Throws std::invalid_argument when the three arrays disagree in length.
  void validate() const;

  RayBatch slice(std::size_t begin, std::size_t end) const;
};

// Per-ray [near, far] interval
struct NearFar {
  float near;
  float far;
};

}  // namespace nerfgrid::geometry
