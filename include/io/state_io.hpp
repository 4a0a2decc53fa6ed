#pragma once
/**
 *  HDF5 persistence of everything a renderer needs to resume: the occupancy
 *  grid, its bitfield and step counter, and both bounding boxes.
 *
 *  Layout (root group):
 *    aabb_train        float[6]
 *    aabb_infer        float[6]
 *    density_grid      float[cascade, gridSize^3]   (Morton order)
 *    density_bitfield  uint8[cascade * gridSize^3 / 8]
 *    step_counter      int32[16, 2]
 *    spheres           SphereRecord[n]              (optional scene)
 *  Attributes: bound, grid_size, cascade.
 */

#include <string>
#include <vector>

#include "field/sphere_field.hpp"
#include "render/volume_renderer.hpp"

namespace nerfgrid::io {

/**
 *  Write the renderer state to a new file (truncating any existing one).
 *
 *  @param spheres  optional analytic scene stored alongside the grid
 *  @throws         std::runtime_error on I/O errors
 */
void saveState(const render::VolumeRenderer& renderer, const std::string& path,
               const std::vector<field::SoftSphere>& spheres = {});

/**
 *  Restore grid, bitfield, step counter and boxes into an existing renderer.
 *  meanDensity is recomputed from the loaded grid.
 *
 *  @throws std::runtime_error when the file is unreadable or its grid size /
 *          cascade count differ from the renderer's
 */
void loadState(render::VolumeRenderer& renderer, const std::string& path);

// Scene stored by saveState(); empty when the file has none.
std::vector<field::SoftSphere> loadSpheres(const std::string& path);

}  // namespace nerfgrid::io
