#include "geometry/sampling.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include "config/render_config.hpp"

namespace nerfgrid::geometry {

using namespace nerfgrid::config;

void RayBatch::validate() const {
  if (directions.size() != origins.size() || directionNorms.size() != origins.size())
    throw std::invalid_argument("RayBatch size mismatch: origins=" + std::to_string(origins.size())
                                + " directions=" + std::to_string(directions.size())
                                + " norms=" + std::to_string(directionNorms.size()));
}

RayBatch RayBatch::slice(std::size_t begin, std::size_t end) const {
  end = std::min(end, size());
  begin = std::min(begin, end);
  RayBatch out;
  out.origins.assign(origins.begin() + begin, origins.begin() + end);
  out.directions.assign(directions.begin() + begin, directions.begin() + end);
  out.directionNorms.assign(directionNorms.begin() + begin, directionNorms.begin() + end);
  return out;
}

static inline float safeComponent(float d) {
  const float mag = std::max(std::fabs(d), kDirectionEpsilon);
  return std::signbit(d) ? -mag : mag;
}

NearFar nearFarFromAabb(const glm::vec3& origin, const glm::vec3& direction,
                        const Aabb& aabb, float minNear) {
  float tmin = -std::numeric_limits<float>::max();
  float tmax =  std::numeric_limits<float>::max();

  for (int axis = 0; axis < 3; ++axis) {
    const float inv = 1.f / safeComponent(direction[axis]);
    float t0 = (aabb.min[axis] - origin[axis]) * inv;
    float t1 = (aabb.max[axis] - origin[axis]) * inv;
    if (t0 > t1) std::swap(t0, t1);
    tmin = std::max(tmin, t0);
    tmax = std::min(tmax, t1);
  }

  const float near = std::max(tmin, minNear);
  if (tmin > tmax || tmax < near) return {kMaxDistance, kMaxDistance};
  return {near, tmax};
}

std::vector<NearFar> nearFarFromAabb(const RayBatch& rays, const Aabb& aabb,
                                     float minNear) {
  rays.validate();
  std::vector<NearFar> out(rays.size());
  for (std::size_t i = 0; i < rays.size(); ++i)
    out[i] = nearFarFromAabb(rays.origins[i], rays.directions[i], aabb, minNear);
  return out;
}

std::vector<float> stratifiedDepths(const std::vector<NearFar>& nearFar,
                                    std::size_t numSteps,
                                    std::mt19937* rng,
                                    std::vector<float>& spacing) {
  if (numSteps == 0) throw std::invalid_argument("stratifiedDepths: numSteps must be >= 1");

  const std::size_t N = nearFar.size();
  std::vector<float> depths(N * numSteps);
  spacing.resize(N);

  // linspace(0, 1, T); a single step sits at 0
  std::vector<float> unit(numSteps, 0.f);
  for (std::size_t t = 1; t < numSteps; ++t)
    unit[t] = static_cast<float>(t) / static_cast<float>(numSteps - 1);

  std::uniform_real_distribution<float> u01(0.f, 1.f);
  for (std::size_t r = 0; r < N; ++r) {
    const float nr = nearFar[r].near;
    const float fr = nearFar[r].far;
    spacing[r] = (fr - nr) / static_cast<float>(numSteps);
    float* row = depths.data() + r * numSteps;
    for (std::size_t t = 0; t < numSteps; ++t) {
      row[t] = nr + (fr - nr) * unit[t];
      if (rng) row[t] += (u01(*rng) - 0.5f) * spacing[r];
    }
  }
  return depths;
}

std::vector<glm::vec3> samplePositions(const RayBatch& rays,
                                       const std::vector<float>& depths,
                                       std::size_t numSteps,
                                       const Aabb& aabb) {
  if (depths.size() != rays.size() * numSteps)
    throw std::invalid_argument("samplePositions: depth count does not match rays x steps");

  std::vector<glm::vec3> xyz(depths.size());
  for (std::size_t r = 0; r < rays.size(); ++r) {
    const glm::vec3& o = rays.origins[r];
    const glm::vec3& d = rays.directions[r];
    for (std::size_t t = 0; t < numSteps; ++t) {
      const std::size_t k = r * numSteps + t;
      xyz[k] = aabb.clip(o + d * depths[k]);
    }
  }
  return xyz;
}

}  // namespace nerfgrid::geometry
