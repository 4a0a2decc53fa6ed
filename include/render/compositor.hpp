#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "render/render_types.hpp"

namespace nerfgrid::render {

// Per-sample compositing terms, row-major [rays x numSteps].
struct AlphaWeights {
  std::size_t numRays  = 0;
  std::size_t numSteps = 0;

  std::vector<float>   deltas;
  std::vector<float>   alphas;
  std::vector<float>   transmittance;
  std::vector<float>   weights;  // alpha * Tr; zeroed where mask == 0 by applyWeightMask()
  std::vector<uint8_t> mask;     // weight > kWeightMaskThreshold, taken before masking
};

/**
 *  Emission-absorption weights along each ray.
 *
 *    delta_i = z_{i+1} - z_i,  delta_{T-1} = spacing
 *    alpha_i = 1 - exp(-delta_i * densityScale * sigma_i)
 *    Tr_i    = prod_{j<i} (1 - alpha_j + 1e-15)
 *    w_i     = alpha_i * Tr_i
 *
 *  The mask is computed here, before any color query; weights are left
 *  unmasked.
 */
AlphaWeights computeWeights(const std::vector<float>& depths,
                            const std::vector<float>& spacing,
                            const std::vector<float>& sigma,
                            std::size_t numSteps,
                            float densityScale);

// Forces weight to exactly zero wherever mask == 0.
void applyWeightMask(AlphaWeights& w);

/**
 *  Per-ray aggregation over masked weights.
 *
 *    image         = sum w rgb + (1 - sum w) * background
 *    depth         = sum w z / norm
 *    depthVariance = sum w (depth - z / norm)^2
 *    centroid      = sum w xyz
 *    auxFeature    = sum w aux     (weights taken as constants)
 *
 *  aux is [rays * numSteps x auxDim]; rgbPerSample is filled from rgb.
 */
RenderResult composite(const AlphaWeights&           w,
                       const std::vector<float>&     depths,
                       const std::vector<glm::vec3>& positions,
                       const std::vector<glm::vec3>& rgb,
                       const std::vector<float>&     aux,
                       std::size_t                   auxDim,
                       const std::vector<float>&     directionNorms,
                       const glm::vec3&              background);

// Upstream sensitivities per ray. Empty vectors count as zero.
struct RayGradients {
  std::vector<glm::vec3> image;
  std::vector<float>     depth;
  std::vector<float>     depthVariance;
  std::vector<glm::vec3> centroid;
  std::vector<float>     auxFeature;  // [rays x auxDim]
};

// Per-sample sensitivities, row-major [rays x numSteps] (aux: x auxDim).
struct SampleGradients {
  std::vector<float>     sigma;
  std::vector<glm::vec3> rgb;
  std::vector<float>     aux;
};

/**
 *  Reverse pass of computeWeights + composite for masked weights.
 *
 *  depthVariance is a detached statistic and the auxiliary embedding is
 *  accumulated with detached weights, so neither reaches sigma; the aux
 *  sensitivity only flows into the embedding itself.
 */
SampleGradients compositeBackward(const AlphaWeights&           w,
                                  const std::vector<float>&     depths,
                                  const std::vector<glm::vec3>& positions,
                                  const std::vector<glm::vec3>& rgb,
                                  std::size_t                   auxDim,
                                  const std::vector<float>&     directionNorms,
                                  const glm::vec3&              background,
                                  float                         densityScale,
                                  const RayGradients&           upstream);

}  // namespace nerfgrid::render
