#pragma once
#include <cstddef>
#include <random>
#include <vector>

#include <glm/glm.hpp>

#include "geometry/primitives.hpp"

namespace nerfgrid::geometry {

/**
 *  Slab intersection of one ray with a box. near is raised to minNear; rays
 *  that miss the box (or whose exit lies before minNear) get near = far =
 *  config::kMaxDistance so that all their samples carry zero weight.
 */
NearFar nearFarFromAabb(const glm::vec3& origin, const glm::vec3& direction,
                        const Aabb& aabb, float minNear);

std::vector<NearFar> nearFarFromAabb(const RayBatch& rays, const Aabb& aabb,
                                     float minNear);

/**
 *  Stratified sample depths, row-major [rays.size() x numSteps].
 *
 *  Depths are linspace(0, 1, numSteps) mapped into each ray's [near, far].
 *  When rng is non-null every depth is jittered by (u - 0.5) * spacing,
 *  spacing = (far - near) / numSteps. Jittered depths are not re-sorted and
 *  may be locally non-monotonic.
 *
 *  @param spacing  receives the per-ray sample spacing
 */
std::vector<float> stratifiedDepths(const std::vector<NearFar>& nearFar,
                                    std::size_t numSteps,
                                    std::mt19937* rng,
                                    std::vector<float>& spacing);

// origin + direction * depth, clipped into the box. Row-major like depths.
std::vector<glm::vec3> samplePositions(const RayBatch& rays,
                                       const std::vector<float>& depths,
                                       std::size_t numSteps,
                                       const Aabb& aabb);

}  // namespace nerfgrid::geometry
