// ─────────────────────────────────────────────────────────────────────────────
//  Header
// ─────────────────────────────────────────────────────────────────────────────
#ifndef NERFGRID_VOLUME_RENDERER_HPP
#define NERFGRID_VOLUME_RENDERER_HPP

// C++ std
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <vector>

// Third‑party
#include <glm/glm.hpp>

// Local
#include "config/render_config.hpp"
#include "field/field.hpp"
#include "geometry/primitives.hpp"
#include "grid/occupancy_grid.hpp"
#include "render/render_types.hpp"

namespace nerfgrid {
namespace render {

// Construction-time settings; also what an options file holds.
struct RendererOptions {
  float       bound            = 1.f;   // half-extent of the scene cube
  std::size_t gridSize         = config::kDefaultGridSize;
  float       densityScale     = config::kDefaultDensityScale;
  float       minNear          = config::kDefaultMinNear;
  float       densityThreshold = config::kDefaultDensityThreshold;
  float       backgroundRadius = 0.f;   // > 0 selects background-field blending
  bool        accelerated      = false; // compacted adaptive marching
  uint32_t    seed             = 0;

  // A rectangular scene box becomes a cube whose half-extent is the box's
  // largest side length.
  std::optional<geometry::Aabb> sceneBox;
};

// Grid contents plus the boxes that go with them.
struct RendererState {
  grid::GridState grid;
  geometry::Aabb  aabbTrain;
  geometry::Aabb  aabbInfer;
};

class VolumeRenderer {
public:
  VolumeRenderer(std::shared_ptr<const field::Field> field, const RendererOptions& options);

  // Rendering (shared with other renders, exclusive of maintenance) --------
  RenderResult render(const geometry::RayBatch& rays, const RenderOptions& options = {});

  RenderResult renderFromPose(const glm::mat4& cameraToWorld,
                              const geometry::Intrinsics& intrinsics,
                              std::size_t height, std::size_t width,
                              const RenderOptions& options = {});

  // Maintenance (exclusive) ------------------------------------------------
  void markUntrainedGrid(const std::vector<glm::mat4>& cameraToWorld,
                         const geometry::Intrinsics& intrinsics,
                         std::size_t batchSize = config::kMarkBatch);
  void refreshOccupancy(float decay = config::kDefaultDecay,
                        std::size_t batchSize = config::kRefreshBatch);
  void reset();
  void recordSteps(int32_t steps, int32_t rays);

  // State (guarded by the grid lock) -------------------------------------
  void setTraining(bool training);
  bool training() const;

  geometry::Aabb aabbTrain() const;
  geometry::Aabb aabbInfer() const;
  void setAabbTrain(const geometry::Aabb& box);
  void setAabbInfer(const geometry::Aabb& box);

  // Consistent snapshot / exclusive restore of grid and boxes together.
  RendererState exportState() const;
  void          importState(const RendererState& state);

  grid::OccupancyGrid&       grid() { return grid_; }
  const grid::OccupancyGrid& grid() const { return grid_; }

  const RendererOptions& options() const { return options_; }
  const field::Field&    field() const { return *field_; }

private:
  // ───────────── helper sections used by render() ─────────────
  // Single pass over the whole batch: sample, query, composite.
  RenderResult run(const geometry::RayBatch& rays, const RenderOptions& options, std::mt19937& rng) const;
  uint32_t nextCallSeed();

  // ───────────── members ─────────────
  const RendererOptions               options_;
  std::shared_ptr<const field::Field> field_;

  geometry::Aabb aabbTrain_;
  geometry::Aabb aabbInfer_;
  bool           training_ = false;

  grid::OccupancyGrid grid_;

  std::mt19937 seedRng_;
  std::mutex   seedMutex_;
};

} // namespace render
} // namespace nerfgrid

#endif // NERFGRID_VOLUME_RENDERER_HPP
