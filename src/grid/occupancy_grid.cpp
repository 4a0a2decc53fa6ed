#include "grid/occupancy_grid.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

#include "grid/morton.hpp"
#include "util/logging.hpp"

using namespace nerfgrid::config;
using nerfgrid::util::logger;

namespace nerfgrid {
namespace grid {

// ─────────────────────────────────────────────────────────────────────────────
//  Grid-wide kernels
// ─────────────────────────────────────────────────────────────────────────────

void emaCombine(std::vector<float>& grid, const std::vector<float>& samples, float decay) {
  if (grid.size() != samples.size())
    throw std::invalid_argument("emaCombine: grid and samples differ in size");
  for (std::size_t i = 0; i < grid.size(); ++i) {
    if (isValidCell(grid[i]) && isValidCell(samples[i]))
      grid[i] = std::max(grid[i] * decay, samples[i]);
  }
}

float meanDensity(const std::vector<float>& grid) {
  if (grid.empty()) return 0.f;
  double sum = 0.0;
  for (float v : grid) sum += std::max(v, 0.f);
  return static_cast<float>(sum / static_cast<double>(grid.size()));
}

void packBits(const std::vector<float>& grid, float threshold, std::vector<uint8_t>& bitfield) {
  if (grid.size() % 8 != 0)
    throw std::invalid_argument("packBits: cell count must be a multiple of 8");
  bitfield.assign(grid.size() / 8, 0);
  for (std::size_t i = 0; i < bitfield.size(); ++i) {
    uint8_t bits = 0;
    for (std::size_t b = 0; b < 8; ++b)
      if (grid[i * 8 + b] > threshold) bits |= static_cast<uint8_t>(1u << b);
    bitfield[i] = bits;
  }
}

// ─────────────────────────────────────────────────────────────────────────────
//  OccupancyGrid
// ─────────────────────────────────────────────────────────────────────────────

static std::size_t cascadeCount(float bound) {
  if (!(bound > 0.f)) throw std::invalid_argument("OccupancyGrid: bound must be positive");
  const int c = 1 + static_cast<int>(std::ceil(std::log2(bound)));
  return static_cast<std::size_t>(std::max(1, c));
}

static std::size_t checkedGridSize(std::size_t n) {
  if (n < 2 || n > kMaxGridSize || (n & (n - 1)) != 0)
    throw std::invalid_argument("OccupancyGrid: grid size must be a power of two in [2, "
                                + std::to_string(kMaxGridSize) + "], got " + std::to_string(n));
  return n;
}

OccupancyGrid::OccupancyGrid(float bound, std::size_t gridSize, float densityScale,
                             float densityThreshold, uint32_t seed)
  : bound_(bound),
    gridSize_(checkedGridSize(gridSize)),
    cascade_(cascadeCount(bound)),
    cellsPerCascade_(gridSize * gridSize * gridSize),
    densityScale_(densityScale),
    densityThreshold_(densityThreshold),
    densities_(cascade_ * cellsPerCascade_, 0.f),
    bitfield_(cascade_ * cellsPerCascade_ / 8, 0),
    rng_(seed) {
  logger()->info("Occupancy grid: bound={} cascades={} resolution={}^3 ({} cells)",
                 bound_, cascade_, gridSize_, densities_.size());
}

float OccupancyGrid::cascadeBound(std::size_t c) const {
  return std::min(std::ldexp(1.f, static_cast<int>(c)), bound_);
}

glm::vec3 OccupancyGrid::cellPosition(std::size_t c, const glm::uvec3& coord) const {
  const float b  = cascadeBound(c);
  const float hc = halfCellSize(c);
  const glm::vec3 unit = 2.f * glm::vec3(coord) / static_cast<float>(gridSize_ - 1) - 1.f;
  return unit * (b - hc);
}

float OccupancyGrid::cell(std::size_t c, const glm::uvec3& coord) const {
  return densities_.at(c * cellsPerCascade_ + coordToIndex(coord));
}

bool OccupancyGrid::isOccupied(std::size_t c, const glm::uvec3& coord) const {
  const std::size_t i = c * cellsPerCascade_ + coordToIndex(coord);
  return (bitfield_.at(i / 8) >> (i % 8)) & 1u;
}

std::size_t OccupancyGrid::occupiedCount() const {
  std::size_t n = 0;
  for (uint8_t byte : bitfield_)
    for (int b = 0; b < 8; ++b) n += (byte >> b) & 1u;
  return n;
}

void OccupancyGrid::markUntrainedGrid(const std::vector<glm::mat4>& cameraToWorld,
                                      const geometry::Intrinsics& intrinsics,
                                      std::size_t batchSize) {
  if (batchSize == 0) throw std::invalid_argument("markUntrainedGrid: batchSize must be >= 1");
  if (intrinsics.fx == 0.f || intrinsics.fy == 0.f)
    throw std::invalid_argument("markUntrainedGrid: focal length must be non-zero");

  std::unique_lock<std::shared_mutex> lock(mutex_);

  const float tanX = intrinsics.cx / intrinsics.fx;
  const float tanY = intrinsics.cy / intrinsics.fy;
  std::vector<uint32_t> count(densities_.size(), 0);

  for (std::size_t head = 0; head < cameraToWorld.size(); head += batchSize) {
    const std::size_t tail = std::min(head + batchSize, cameraToWorld.size());

    // world -> camera: R^T (x - t)
    std::vector<glm::mat3> worldToCam;
    std::vector<glm::vec3> eye;
    for (std::size_t k = head; k < tail; ++k) {
      worldToCam.push_back(glm::transpose(glm::mat3(cameraToWorld[k])));
      eye.emplace_back(cameraToWorld[k][3]);
    }

    for (std::size_t c = 0; c < cascade_; ++c) {
      const float margin = 2.f * halfCellSize(c);
      uint32_t* cnt = count.data() + c * cellsPerCascade_;

      #pragma omp parallel for schedule(static)
      for (std::ptrdiff_t i = 0; i < static_cast<std::ptrdiff_t>(cellsPerCascade_); ++i) {
        const glm::vec3 xyz = cellPosition(c, indexToCoord(static_cast<uint32_t>(i)));
        uint32_t seen = 0;
        for (std::size_t k = 0; k < worldToCam.size(); ++k) {
          const glm::vec3 cam = worldToCam[k] * (xyz - eye[k]);
          if (cam.z > 0.f
              && std::fabs(cam.x) < tanX * cam.z + margin
              && std::fabs(cam.y) < tanY * cam.z + margin)
            ++seen;
        }
        cnt[i] += seen;
      }
    }
  }

  std::size_t excluded = 0;
  for (std::size_t i = 0; i < densities_.size(); ++i) {
    if (count[i] == 0) {
      densities_[i] = kExcludedCell;
      ++excluded;
    }
  }
  logger()->info("Marked untrained grid: {} of {} cells unseen by {} cameras",
                 excluded, densities_.size(), cameraToWorld.size());
}

void OccupancyGrid::sampleCells(const field::Field& field, std::size_t c,
                                const std::vector<uint32_t>& indices, std::vector<float>& tmp) {
  const float hc = halfCellSize(c);
  std::uniform_real_distribution<float> jitter(-hc, hc);

  std::vector<glm::vec3> xyz(indices.size());
  for (std::size_t i = 0; i < indices.size(); ++i) {
    glm::vec3 p = cellPosition(c, indexToCoord(indices[i]));
    p.x += jitter(rng_);
    p.y += jitter(rng_);
    p.z += jitter(rng_);
    xyz[i] = p;
  }

  const field::DensityOutput out = field.density(xyz);
  if (out.sigma.size() != xyz.size())
    throw std::runtime_error("Field returned " + std::to_string(out.sigma.size())
                             + " densities for " + std::to_string(xyz.size()) + " positions");

  float* dst = tmp.data() + c * cellsPerCascade_;
  for (std::size_t i = 0; i < indices.size(); ++i)
    dst[indices[i]] = out.sigma[i] * densityScale_;
}

void OccupancyGrid::sampleFullSweep(const field::Field& field, std::size_t batchSize,
                                    std::vector<float>& tmp) {
  const uint32_t H = static_cast<uint32_t>(gridSize_);
  const uint32_t S = static_cast<uint32_t>(std::min<std::size_t>(batchSize, gridSize_));

  std::vector<uint32_t> indices;
  for (uint32_t x0 = 0; x0 < H; x0 += S) {
    for (uint32_t y0 = 0; y0 < H; y0 += S) {
      for (uint32_t z0 = 0; z0 < H; z0 += S) {
        indices.clear();
        for (uint32_t x = x0; x < std::min(x0 + S, H); ++x)
          for (uint32_t y = y0; y < std::min(y0 + S, H); ++y)
            for (uint32_t z = z0; z < std::min(z0 + S, H); ++z)
              indices.push_back(coordToIndex(x, y, z));

        for (std::size_t c = 0; c < cascade_; ++c) sampleCells(field, c, indices, tmp);
      }
    }
  }
}

void OccupancyGrid::samplePartial(const field::Field& field, std::vector<float>& tmp) {
  const std::size_t N = cellsPerCascade_ / 4;
  std::uniform_int_distribution<uint32_t> coordDist(0, static_cast<uint32_t>(gridSize_ - 1));

  for (std::size_t c = 0; c < cascade_; ++c) {
    std::vector<uint32_t> indices;
    indices.reserve(2 * N);
    for (std::size_t i = 0; i < N; ++i) {
      const uint32_t x = coordDist(rng_), y = coordDist(rng_), z = coordDist(rng_);
      indices.push_back(coordToIndex(x, y, z));
    }

    const float* cas = densities_.data() + c * cellsPerCascade_;
    std::vector<uint32_t> occupied;
    for (std::size_t i = 0; i < cellsPerCascade_; ++i)
      if (cas[i] > 0.f) occupied.push_back(static_cast<uint32_t>(i));

    if (occupied.empty()) {
      logger()->warn("Cascade {} has no occupied cells; refreshing random cells only", c);
    } else {
      std::uniform_int_distribution<std::size_t> pick(0, occupied.size() - 1);
      for (std::size_t i = 0; i < N; ++i) indices.push_back(occupied[pick(rng_)]);
    }

    sampleCells(field, c, indices, tmp);
  }
}

void OccupancyGrid::refresh(const field::Field& field, float decay, std::size_t batchSize) {
  if (batchSize == 0) throw std::invalid_argument("refresh: batchSize must be >= 1");

  std::unique_lock<std::shared_mutex> lock(mutex_);

  std::vector<float> tmp(densities_.size(), kExcludedCell);
  if (refreshCount_ < kWarmupRefreshes) {
    sampleFullSweep(field, batchSize, tmp);
  } else {
    samplePartial(field, tmp);
  }

  emaCombine(densities_, tmp, decay);
  meanDensity_ = grid::meanDensity(densities_);
  ++refreshCount_;

  packBits(densities_, std::min(meanDensity_, densityThreshold_), bitfield_);
  stepCounter_.consume();

  logger()->debug("[density grid] refresh={} mean={:.4f} occupied={}/{} | [step counter] mean={}",
                  refreshCount_, meanDensity_, occupiedCount(), densities_.size(),
                  stepCounter_.meanSteps());
}

void OccupancyGrid::reset() {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  std::fill(densities_.begin(), densities_.end(), 0.f);
  std::fill(bitfield_.begin(), bitfield_.end(), 0);
  stepCounter_.reset();
  meanDensity_  = 0.f;
  refreshCount_ = 0;
}

void OccupancyGrid::recordSteps(int32_t steps, int32_t rays) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  stepCounter_.record(steps, rays);
}

GridState OccupancyGrid::exportState() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return exportStateLocked();
}

GridState OccupancyGrid::exportStateLocked() const {
  GridState s;
  s.gridSize    = gridSize_;
  s.cascade     = cascade_;
  s.densities   = densities_;
  s.bitfield    = bitfield_;
  s.stepCounter = stepCounter_.slots();
  return s;
}

void OccupancyGrid::importState(const GridState& s) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  importStateLocked(s);
}

void OccupancyGrid::importStateLocked(const GridState& s) {
  if (s.gridSize != gridSize_ || s.cascade != cascade_)
    throw std::runtime_error("Grid state " + std::to_string(s.cascade) + "x" + std::to_string(s.gridSize)
                             + "^3 does not match grid " + std::to_string(cascade_) + "x"
                             + std::to_string(gridSize_) + "^3");
  if (s.densities.size() != densities_.size() || s.bitfield.size() != bitfield_.size())
    throw std::runtime_error("Grid state buffers have the wrong size");

  densities_ = s.densities;
  bitfield_  = s.bitfield;
  stepCounter_.reset();
  stepCounter_.restore(s.stepCounter);
  meanDensity_ = grid::meanDensity(densities_);
}

} // namespace grid
} // namespace nerfgrid
