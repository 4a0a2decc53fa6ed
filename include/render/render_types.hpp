#pragma once
#include <cstddef>
#include <optional>
#include <vector>

#include <glm/glm.hpp>

#include "config/render_config.hpp"

namespace nerfgrid::render {

struct RenderOptions {
  bool        staged        = false;
  std::size_t maxRayBatch   = config::kDefaultMaxRayBatch;
  std::optional<glm::vec3> backgroundColor;  // white when unset
  bool        perturb       = false;
  std::size_t numSteps      = config::kDefaultNumSteps;
  std::size_t upsampleSteps = 0;             // must stay 0: single pass only
};

// Per-ray outputs; rgbPerSample is [rays x numSteps], auxFeature [rays x auxDim].
struct RenderResult {
  std::vector<glm::vec3> image;
  std::vector<float>     depth;
  std::vector<float>     depthVariance;
  std::vector<glm::vec3> centroid;
  std::vector<float>     auxFeature;
  std::vector<glm::vec3> rgbPerSample;
  std::vector<float>     weightSum;

  std::size_t auxDim   = 0;
  std::size_t numSteps = 0;

  std::size_t size() const { return image.size(); }

  void allocate(std::size_t numRays, std::size_t steps, std::size_t aux);
  // Copies chunk into rays [offset, offset + chunk.size())
  void assignSlice(std::size_t offset, const RenderResult& chunk);
};

}  // namespace nerfgrid::render
