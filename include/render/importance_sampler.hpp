#pragma once
#include <cstddef>
#include <random>
#include <vector>

namespace nerfgrid::render {

/**
 *  Inverse-CDF resampling of depths (coarse -> fine building block).
 *
 *  @param bins          [numRays x T] interval boundaries per ray
 *  @param weights       [numRays x (T-1)] mass of each interval
 *  @param T             boundaries per ray (>= 2)
 *  @param numSamples    samples drawn per ray
 *  @param deterministic evenly spaced quantiles instead of uniform draws
 *  @param rng           required when deterministic is false
 *  @returns             [numRays x numSamples] new depths
 *
 *  Weights get +1e-5 before normalisation. An interval whose CDF span is
 *  below 1e-5 collapses its samples onto the interval's lower boundary.
 */
std::vector<float> samplePdf(const std::vector<float>& bins,
                             const std::vector<float>& weights,
                             std::size_t T,
                             std::size_t numSamples,
                             bool deterministic,
                             std::mt19937* rng = nullptr);

}  // namespace nerfgrid::render
