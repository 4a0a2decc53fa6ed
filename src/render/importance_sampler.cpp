#include "render/importance_sampler.hpp"

#include <algorithm>
#include <stdexcept>

#include "config/render_config.hpp"

namespace nerfgrid::render {

using namespace nerfgrid::config;

std::vector<float> samplePdf(const std::vector<float>& bins,
                             const std::vector<float>& weights,
                             std::size_t T,
                             std::size_t numSamples,
                             bool deterministic,
                             std::mt19937* rng) {
  if (T < 2) throw std::invalid_argument("samplePdf: need at least two bin boundaries");
  if (bins.size() % T != 0)
    throw std::invalid_argument("samplePdf: bins is not a multiple of T");
  const std::size_t B = bins.size() / T;
  if (weights.size() != B * (T - 1))
    throw std::invalid_argument("samplePdf: weights must be [rays x (T-1)]");
  if (!deterministic && rng == nullptr)
    throw std::invalid_argument("samplePdf: stochastic sampling needs an rng");

  const std::size_t n = numSamples;
  std::vector<float> samples(B * n);
  if (n == 0) return samples;

  std::vector<float> u(n);
  if (deterministic) {
    // linspace(0.5/n, 1 - 0.5/n, n)
    const float lo = 0.5f / static_cast<float>(n);
    const float hi = 1.f - lo;
    for (std::size_t j = 0; j < n; ++j)
      u[j] = (n == 1) ? lo : lo + (hi - lo) * static_cast<float>(j) / static_cast<float>(n - 1);
  }

  std::uniform_real_distribution<float> u01(0.f, 1.f);
  std::vector<float> cdf(T);
  for (std::size_t b = 0; b < B; ++b) {
    const float* w   = weights.data() + b * (T - 1);
    const float* bin = bins.data() + b * T;

    float total = 0.f;
    for (std::size_t i = 0; i + 1 < T; ++i) total += w[i] + kPdfWeightEpsilon;
    cdf[0] = 0.f;
    for (std::size_t i = 0; i + 1 < T; ++i) cdf[i + 1] = cdf[i] + (w[i] + kPdfWeightEpsilon) / total;

    if (!deterministic)
      for (auto& q : u) q = u01(*rng);

    for (std::size_t j = 0; j < n; ++j) {
      const std::size_t idx =
          static_cast<std::size_t>(std::upper_bound(cdf.begin(), cdf.end(), u[j]) - cdf.begin());
      const std::size_t below = idx > 0 ? idx - 1 : 0;
      const std::size_t above = std::min(T - 1, idx);

      const float denom = cdf[above] - cdf[below];
      float s = bin[below];
      if (denom >= kCdfSpanEpsilon)
        s += (u[j] - cdf[below]) / denom * (bin[above] - bin[below]);
      samples[b * n + j] = s;
    }
  }
  return samples;
}

}  // namespace nerfgrid::render
