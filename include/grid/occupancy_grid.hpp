// ─────────────────────────────────────────────────────────────────────────────
//  Multi-cascade occupancy grid
// ─────────────────────────────────────────────────────────────────────────────
#ifndef NERFGRID_OCCUPANCY_GRID_HPP
#define NERFGRID_OCCUPANCY_GRID_HPP

// C++ std
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <vector>

// Third-party
#include <glm/glm.hpp>

// Local
#include "config/render_config.hpp"
#include "field/field.hpp"
#include "geometry/primitives.hpp"
#include "grid/step_counter.hpp"

namespace nerfgrid {
namespace grid {

// Cell values are either a density estimate (>= 0) or config::kExcludedCell
// (-1) for space no training camera sees. The sentinel is load-bearing: it is
// what the refresh combine tests for and what gets persisted.
inline bool isValidCell(float v) { return v >= 0.f; }

/**
 *  EMA combine: grid = max(grid * decay, samples) where both sides are valid.
 *  Cells invalid on either side are left untouched.
 */
void emaCombine(std::vector<float>& grid, const std::vector<float>& samples, float decay);

// Mean over the grid with negative cells counted as zero.
float meanDensity(const std::vector<float>& grid);

// bit (i % 8) of byte (i / 8) = grid[i] > threshold. grid.size() % 8 == 0.
void packBits(const std::vector<float>& grid, float threshold, std::vector<uint8_t>& bitfield);

// Everything that survives a save / load cycle.
struct GridState {
  std::size_t            gridSize = 0;
  std::size_t            cascade  = 0;
  std::vector<float>     densities;  // [cascade x gridSize^3], Morton order per cascade
  std::vector<uint8_t>   bitfield;   // [cascade x gridSize^3 / 8]
  StepCounter::Slots     stepCounter{};
};

class OccupancyGrid {
public:
  OccupancyGrid(float bound,
                std::size_t gridSize = config::kDefaultGridSize,
                float densityScale = config::kDefaultDensityScale,
                float densityThreshold = config::kDefaultDensityThreshold,
                uint32_t seed = 0);

  // Geometry --------------------------------------------------------------
  std::size_t gridSize() const { return gridSize_; }
  std::size_t cascade() const { return cascade_; }
  std::size_t cellsPerCascade() const { return cellsPerCascade_; }
  float       bound() const { return bound_; }
  float       cascadeBound(std::size_t c) const;
  float       halfCellSize(std::size_t c) const { return cascadeBound(c) / static_cast<float>(gridSize_); }
  // Un-jittered world position of a cell
  glm::vec3   cellPosition(std::size_t c, const glm::uvec3& coord) const;

  // Maintenance (exclusive) -----------------------------------------------
  /**
   *  Marks every cell seen by none of the cameras as excluded.
   *
   *  @param cameraToWorld  training poses, camera looking down +z
   *  @param intrinsics     shared by all poses
   *  @param batchSize      cameras tested per pass
   */
  void markUntrainedGrid(const std::vector<glm::mat4>& cameraToWorld,
                         const geometry::Intrinsics& intrinsics,
                         std::size_t batchSize = config::kMarkBatch);

  // One refresh step; full sweeps for the first kWarmupRefreshes calls,
  // partial sweeps afterwards.
  void refresh(const field::Field& field,
               float decay = config::kDefaultDecay,
               std::size_t batchSize = config::kRefreshBatch);

  void reset();

  void recordSteps(int32_t steps, int32_t rays);

  GridState exportState() const;
  void      importState(const GridState& state);

  // Same as exportState()/importState(), for a caller already holding
  // readLock() or writeLock() respectively.
  GridState exportStateLocked() const;
  void      importStateLocked(const GridState& state);

  // Readers ---------------------------------------------------------------
  // Hold while reading densities()/bitfield() from outside a render call.
  std::shared_lock<std::shared_mutex> readLock() const { return std::shared_lock<std::shared_mutex>(mutex_); }
  // Exclusive hold for state kept next to the grid by its owner.
  std::unique_lock<std::shared_mutex> writeLock() { return std::unique_lock<std::shared_mutex>(mutex_); }

  const std::vector<float>&   densities() const { return densities_; }
  const std::vector<uint8_t>& bitfield() const { return bitfield_; }
  float       cell(std::size_t c, const glm::uvec3& coord) const;
  bool        isOccupied(std::size_t c, const glm::uvec3& coord) const;
  std::size_t occupiedCount() const;

  float       meanDensity() const { return meanDensity_; }
  std::size_t refreshCount() const { return refreshCount_; }
  bool        warmedUp() const { return refreshCount_ >= config::kWarmupRefreshes; }
  uint32_t    meanSteps() const { return stepCounter_.meanSteps(); }
  const StepCounter& stepCounter() const { return stepCounter_; }

private:
  void sampleFullSweep(const field::Field& field, std::size_t batchSize, std::vector<float>& tmp);
  void samplePartial(const field::Field& field, std::vector<float>& tmp);
  // Queries jittered cell positions of one cascade and scatters into tmp.
  void sampleCells(const field::Field& field, std::size_t c,
                   const std::vector<uint32_t>& indices, std::vector<float>& tmp);

  const float       bound_;
  const std::size_t gridSize_;
  const std::size_t cascade_;
  const std::size_t cellsPerCascade_;
  const float       densityScale_;
  const float       densityThreshold_;

  std::vector<float>   densities_;
  std::vector<uint8_t> bitfield_;
  StepCounter          stepCounter_;
  float                meanDensity_  = 0.f;
  std::size_t          refreshCount_ = 0;

  std::mt19937 rng_;
  mutable std::shared_mutex mutex_;
};

} // namespace grid
} // namespace nerfgrid

#endif // NERFGRID_OCCUPANCY_GRID_HPP
