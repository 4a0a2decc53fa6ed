#include "render/compositor.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "config/render_config.hpp"

namespace nerfgrid::render {

using namespace nerfgrid::config;

void RenderResult::allocate(std::size_t numRays, std::size_t steps, std::size_t aux) {
  numSteps = steps;
  auxDim   = aux;
  image.assign(numRays, glm::vec3(0.f));
  depth.assign(numRays, 0.f);
  depthVariance.assign(numRays, 0.f);
  centroid.assign(numRays, glm::vec3(0.f));
  auxFeature.assign(numRays * aux, 0.f);
  rgbPerSample.assign(numRays * steps, glm::vec3(0.f));
  weightSum.assign(numRays, 0.f);
}

void RenderResult::assignSlice(std::size_t offset, const RenderResult& chunk) {
  const std::size_t n = chunk.size();
  if (offset + n > size() || chunk.numSteps != numSteps || chunk.auxDim != auxDim)
    throw std::invalid_argument("RenderResult::assignSlice: chunk does not fit");

  std::copy(chunk.image.begin(),         chunk.image.end(),         image.begin() + offset);
  std::copy(chunk.depth.begin(),         chunk.depth.end(),         depth.begin() + offset);
  std::copy(chunk.depthVariance.begin(), chunk.depthVariance.end(), depthVariance.begin() + offset);
  std::copy(chunk.centroid.begin(),      chunk.centroid.end(),      centroid.begin() + offset);
  std::copy(chunk.weightSum.begin(),     chunk.weightSum.end(),     weightSum.begin() + offset);
  std::copy(chunk.auxFeature.begin(),    chunk.auxFeature.end(),    auxFeature.begin() + offset * auxDim);
  std::copy(chunk.rgbPerSample.begin(),  chunk.rgbPerSample.end(),  rgbPerSample.begin() + offset * numSteps);
}

AlphaWeights computeWeights(const std::vector<float>& depths,
                            const std::vector<float>& spacing,
                            const std::vector<float>& sigma,
                            std::size_t numSteps,
                            float densityScale) {
  if (numSteps == 0 || depths.size() != spacing.size() * numSteps || sigma.size() != depths.size())
    throw std::invalid_argument("computeWeights: depths, spacing and sigma disagree in shape");

  AlphaWeights w;
  w.numRays  = spacing.size();
  w.numSteps = numSteps;
  const std::size_t total = depths.size();
  w.deltas.resize(total);
  w.alphas.resize(total);
  w.transmittance.resize(total);
  w.weights.resize(total);
  w.mask.resize(total);

  const std::size_t T = numSteps;
  #pragma omp parallel for schedule(static)
  for (std::ptrdiff_t r = 0; r < static_cast<std::ptrdiff_t>(w.numRays); ++r) {
    const std::size_t base = static_cast<std::size_t>(r) * T;
    float tr = 1.f;
    for (std::size_t t = 0; t < T; ++t) {
      const std::size_t k = base + t;
      const float delta = (t + 1 < T) ? depths[k + 1] - depths[k] : spacing[r];
      const float alpha = 1.f - std::exp(-delta * densityScale * sigma[k]);
      const float weight = alpha * tr;
      w.deltas[k]        = delta;
      w.alphas[k]        = alpha;
      w.transmittance[k] = tr;
      w.weights[k]       = weight;
      w.mask[k]          = weight > kWeightMaskThreshold ? 1 : 0;
      tr *= (1.f - alpha + kTransmittanceEpsilon);
    }
  }
  return w;
}

void applyWeightMask(AlphaWeights& w) {
  for (std::size_t k = 0; k < w.weights.size(); ++k)
    if (!w.mask[k]) w.weights[k] = 0.f;
}

RenderResult composite(const AlphaWeights&           w,
                       const std::vector<float>&     depths,
                       const std::vector<glm::vec3>& positions,
                       const std::vector<glm::vec3>& rgb,
                       const std::vector<float>&     aux,
                       std::size_t                   auxDim,
                       const std::vector<float>&     directionNorms,
                       const glm::vec3&              background) {
  const std::size_t N = w.numRays;
  const std::size_t T = w.numSteps;
  if (depths.size() != N * T || positions.size() != N * T || rgb.size() != N * T
      || aux.size() != N * T * auxDim || directionNorms.size() != N)
    throw std::invalid_argument("composite: per-sample inputs disagree in shape");

  RenderResult out;
  out.allocate(N, T, auxDim);
  std::copy(rgb.begin(), rgb.end(), out.rgbPerSample.begin());

  #pragma omp parallel for schedule(static)
  for (std::ptrdiff_t r = 0; r < static_cast<std::ptrdiff_t>(N); ++r) {
    const std::size_t base = static_cast<std::size_t>(r) * T;
    const float norm = directionNorms[r];

    float weightSum = 0.f, zSum = 0.f;
    glm::vec3 color(0.f), centroid(0.f);
    float* auxOut = out.auxFeature.data() + static_cast<std::size_t>(r) * auxDim;
    for (std::size_t t = 0; t < T; ++t) {
      const std::size_t k = base + t;
      const float wk = w.weights[k];
      weightSum += wk;
      zSum      += wk * depths[k];
      color     += wk * rgb[k];
      centroid  += wk * positions[k];
      const float* a = aux.data() + k * auxDim;
      for (std::size_t c = 0; c < auxDim; ++c) auxOut[c] += wk * a[c];
    }

    const float depth = zSum / norm;
    float variance = 0.f;
    for (std::size_t t = 0; t < T; ++t) {
      const float diff = depth - depths[base + t] / norm;
      variance += w.weights[base + t] * diff * diff;
    }

    out.image[r]         = color + (1.f - weightSum) * background;
    out.depth[r]         = depth;
    out.depthVariance[r] = variance;
    out.centroid[r]      = centroid;
    out.weightSum[r]     = weightSum;
  }
  return out;
}

SampleGradients compositeBackward(const AlphaWeights&           w,
                                  const std::vector<float>&     depths,
                                  const std::vector<glm::vec3>& positions,
                                  const std::vector<glm::vec3>& rgb,
                                  std::size_t                   auxDim,
                                  const std::vector<float>&     directionNorms,
                                  const glm::vec3&              background,
                                  float                         densityScale,
                                  const RayGradients&           g) {
  const std::size_t N = w.numRays;
  const std::size_t T = w.numSteps;
  if (depths.size() != N * T || positions.size() != N * T || rgb.size() != N * T
      || directionNorms.size() != N)
    throw std::invalid_argument("compositeBackward: per-sample inputs disagree in shape");

  SampleGradients out;
  out.sigma.assign(N * T, 0.f);
  out.rgb.assign(N * T, glm::vec3(0.f));
  out.aux.assign(N * T * auxDim, 0.f);

  const bool hasImage    = !g.image.empty();
  const bool hasDepth    = !g.depth.empty();
  const bool hasCentroid = !g.centroid.empty();
  const bool hasAux      = !g.auxFeature.empty();

  #pragma omp parallel for schedule(static)
  for (std::ptrdiff_t r = 0; r < static_cast<std::ptrdiff_t>(N); ++r) {
    const std::size_t base = static_cast<std::size_t>(r) * T;
    const glm::vec3 gImage    = hasImage ? g.image[r] : glm::vec3(0.f);
    const float     gDepth    = hasDepth ? g.depth[r] : 0.f;
    const glm::vec3 gCentroid = hasCentroid ? g.centroid[r] : glm::vec3(0.f);
    const float     norm      = directionNorms[r];

    // dL/dw_k for masked-in samples
    std::vector<float> dw(T, 0.f);
    for (std::size_t t = 0; t < T; ++t) {
      const std::size_t k = base + t;
      if (!w.mask[k]) continue;
      dw[t] = glm::dot(gImage, rgb[k] - background)
            + gDepth * depths[k] / norm
            + glm::dot(gCentroid, positions[k]);
      out.rgb[k] = gImage * w.weights[k];
      if (hasAux) {
        const float* ga = g.auxFeature.data() + static_cast<std::size_t>(r) * auxDim;
        float* da = out.aux.data() + k * auxDim;
        for (std::size_t c = 0; c < auxDim; ++c) da[c] = ga[c] * w.weights[k];
      }
    }

    // Walk back to front carrying sum_{i>k} dL/dw_i * w_i
    float suffix = 0.f;
    for (std::size_t t = T; t-- > 0;) {
      const std::size_t k = base + t;
      const float alpha = w.alphas[k];
      float dAlpha = -suffix / (1.f - alpha + kTransmittanceEpsilon);
      if (w.mask[k]) dAlpha += dw[t] * w.transmittance[k];
      out.sigma[k] = dAlpha * w.deltas[k] * densityScale * (1.f - alpha);
      suffix += dw[t] * w.weights[k];
    }
  }
  return out;
}

}  // namespace nerfgrid::render
