#include "io/state_io.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <stdexcept>

#include "io/hdf5_types.hpp"
#include "util/logging.hpp"

using namespace HighFive;
using nerfgrid::util::logger;

namespace nerfgrid::io {

static std::vector<float> boxToVector(const geometry::Aabb& box) {
  const std::array<float, 6> a = box.toArray();
  return std::vector<float>(a.begin(), a.end());
}

static geometry::Aabb readBox(const File& file, const std::string& name) {
  std::vector<float> v;
  file.getDataSet(name).read(v);
  if (v.size() != 6)
    throw std::runtime_error("Dataset \"" + name + "\" must hold 6 floats, got " + std::to_string(v.size()));
  std::array<float, 6> a{};
  std::copy(v.begin(), v.end(), a.begin());
  return geometry::Aabb::fromArray(a);
}

template <typename T>
static T readAttribute(const File& file, const std::string& name) {
  if (!file.hasAttribute(name))
    throw std::runtime_error("Attribute \"" + name + "\" not found in " + file.getName());
  T value{};
  file.getAttribute(name).read(value);
  return value;
}

void saveState(const render::VolumeRenderer& renderer, const std::string& path,
               const std::vector<field::SoftSphere>& spheres) {
  const render::RendererState snapshot = renderer.exportState();
  const grid::GridState& state = snapshot.grid;
  const std::size_t cells = state.densities.size() / state.cascade;

  // ───  reshape into [cascade, gridSize^3] and [16, 2] ─────────────
  std::vector<std::vector<float>> grid(state.cascade);
  for (std::size_t c = 0; c < state.cascade; ++c)
    grid[c].assign(state.densities.begin() + c * cells, state.densities.begin() + (c + 1) * cells);

  std::vector<std::vector<int32_t>> steps;
  for (const auto& slot : state.stepCounter) steps.push_back({slot[0], slot[1]});

  try {
    File file(path, File::Overwrite);

    file.createDataSet("aabb_train", boxToVector(snapshot.aabbTrain));
    file.createDataSet("aabb_infer", boxToVector(snapshot.aabbInfer));
    file.createDataSet("density_grid", grid);
    file.createDataSet("density_bitfield", state.bitfield);
    file.createDataSet("step_counter", steps);

    file.createAttribute("bound", renderer.options().bound);
    file.createAttribute("grid_size", static_cast<uint32_t>(state.gridSize));
    file.createAttribute("cascade", static_cast<uint32_t>(state.cascade));

    if (!spheres.empty()) {
      std::vector<SphereRecord> records;
      for (const auto& s : spheres)
        records.push_back({s.center.x, s.center.y, s.center.z, s.radius, s.density,
                           s.rgb.r, s.rgb.g, s.rgb.b});
      file.createDataSet("spheres", records);
    }
  } catch (const HighFive::Exception& e) {
    throw std::runtime_error("Failed to write state to " + path + ": " + e.what());
  }

  logger()->info("Saved state to {} ({} cascades, {}^3 cells)", path, state.cascade, state.gridSize);
}

void loadState(render::VolumeRenderer& renderer, const std::string& path) {
  render::RendererState snapshot;
  grid::GridState& state = snapshot.grid;
  float bound = 0.f;

  try {
    File file(path, File::ReadOnly);

    bound          = readAttribute<float>(file, "bound");
    state.gridSize = readAttribute<uint32_t>(file, "grid_size");
    state.cascade  = readAttribute<uint32_t>(file, "cascade");

    snapshot.aabbTrain = readBox(file, "aabb_train");
    snapshot.aabbInfer = readBox(file, "aabb_infer");

    std::vector<std::vector<float>> grid;
    file.getDataSet("density_grid").read(grid);
    for (const auto& row : grid) state.densities.insert(state.densities.end(), row.begin(), row.end());

    file.getDataSet("density_bitfield").read(state.bitfield);

    std::vector<std::vector<int32_t>> steps;
    file.getDataSet("step_counter").read(steps);
    if (steps.size() != state.stepCounter.size())
      throw std::runtime_error("step_counter must have " + std::to_string(state.stepCounter.size()) + " rows");
    for (std::size_t i = 0; i < steps.size(); ++i) {
      if (steps[i].size() != 2) throw std::runtime_error("step_counter rows must have 2 columns");
      state.stepCounter[i] = {steps[i][0], steps[i][1]};
    }
  } catch (const HighFive::Exception& e) {
    throw std::runtime_error("Failed to read state from " + path + ": " + e.what());
  }

  if (std::fabs(bound - renderer.options().bound) > 1e-6f)
    logger()->warn("State {} was saved with bound {} but the renderer uses {}",
                   path, bound, renderer.options().bound);

  renderer.importState(snapshot);

  logger()->info("Loaded state from {} (mean density {:.4f}, {} occupied cells)",
                 path, renderer.grid().meanDensity(), renderer.grid().occupiedCount());
}

std::vector<field::SoftSphere> loadSpheres(const std::string& path) {
  std::vector<SphereRecord> records;
  try {
    File file(path, File::ReadOnly);
    if (!file.exist("spheres")) return {};
    file.getDataSet("spheres").read(records);
  } catch (const HighFive::Exception& e) {
    throw std::runtime_error("Failed to read spheres from " + path + ": " + e.what());
  }

  std::vector<field::SoftSphere> spheres;
  for (const auto& r : records)
    spheres.push_back({glm::vec3(r.cx, r.cy, r.cz), r.radius, r.density, glm::vec3(r.r, r.g, r.b)});
  return spheres;
}

}  // namespace nerfgrid::io
