#pragma once

/**
 *  morton.hpp - Z-order (Morton) mapping between grid cells and the linear
 *  index used by the occupancy grid and its bitfield.
 *
 *  x occupies bits 0,3,6,..., y bits 1,4,7,..., z bits 2,5,8,...
 *  Coordinates carry up to 10 bits per axis, so any power-of-two grid up to
 *  1024^3 maps onto [0, gridSize^3) one-to-one.
 */

#include <cstdint>

#include <glm/glm.hpp>

namespace nerfgrid::grid {

uint32_t coordToIndex(uint32_t x, uint32_t y, uint32_t z);
uint32_t coordToIndex(const glm::uvec3& coord);

glm::uvec3 indexToCoord(uint32_t index);

}  // namespace nerfgrid::grid
