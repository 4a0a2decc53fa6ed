#include "grid/morton.hpp"

namespace nerfgrid::grid {

// Insert two zero bits between each of the low 10 bits: 0b111 -> 0b1001001
static uint32_t expandBits(uint32_t v) {
  uint32_t x = v & 0x3FFu;
  x = (x | (x << 16)) & 0x030000FFu;
  x = (x | (x << 8))  & 0x0300F00Fu;
  x = (x | (x << 4))  & 0x030C30C3u;
  x = (x | (x << 2))  & 0x09249249u;
  return x;
}

// Inverse of expandBits()
static uint32_t compactBits(uint32_t v) {
  uint32_t x = v & 0x09249249u;
  x = (x ^ (x >> 2))  & 0x030C30C3u;
  x = (x ^ (x >> 4))  & 0x0300F00Fu;
  x = (x ^ (x >> 8))  & 0x030000FFu;
  x = (x ^ (x >> 16)) & 0x000003FFu;
  return x;
}

uint32_t coordToIndex(uint32_t x, uint32_t y, uint32_t z) {
  return expandBits(x) | (expandBits(y) << 1) | (expandBits(z) << 2);
}

uint32_t coordToIndex(const glm::uvec3& coord) {
  return coordToIndex(coord.x, coord.y, coord.z);
}

glm::uvec3 indexToCoord(uint32_t index) {
  return glm::uvec3(compactBits(index), compactBits(index >> 1), compactBits(index >> 2));
}

}  // namespace nerfgrid::grid
