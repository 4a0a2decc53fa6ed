#include <gtest/gtest.h>

#include <cmath>
#include <random>
#include <stdexcept>
#include <vector>

#include "config/render_config.hpp"
#include "render/compositor.hpp"

using namespace nerfgrid::render;
using nerfgrid::config::kWeightMaskThreshold;

namespace {

// One ray worth of per-sample inputs
struct RayFixture {
    std::vector<float>     depths;
    std::vector<float>     spacing;
    std::vector<float>     sigma;
    std::vector<glm::vec3> positions;
    std::vector<glm::vec3> rgb;
    std::vector<float>     norms{1.f};
    std::size_t            T = 0;
};

RayFixture FourSamples() {
    RayFixture f;
    f.T         = 4;
    f.depths    = {0.5f, 0.8f, 1.2f, 1.5f};
    f.spacing   = {0.25f};
    f.sigma     = {0.6f, 1.1f, 0.4f, 2.0f};
    f.positions = {{0.1f, 0.f, 0.5f}, {0.2f, 0.1f, 0.8f}, {0.3f, 0.1f, 1.2f}, {0.4f, 0.2f, 1.5f}};
    f.rgb       = {{0.9f, 0.1f, 0.1f}, {0.1f, 0.8f, 0.2f}, {0.2f, 0.2f, 0.7f}, {0.5f, 0.5f, 0.5f}};
    f.norms     = {1.25f};
    return f;
}

RenderResult Forward(const RayFixture& f, const std::vector<float>& sigma, float scale,
                     const glm::vec3& bg) {
    AlphaWeights w = computeWeights(f.depths, f.spacing, sigma, f.T, scale);
    applyWeightMask(w);
    return composite(w, f.depths, f.positions, f.rgb, {}, 0, f.norms, bg);
}

}  // namespace

// ===========================================================================
// Weights
// ===========================================================================

TEST(ComputeWeightsTest, HalfAlphaChain) {
    const float ln2 = std::log(2.f);
    const AlphaWeights w = computeWeights({0.f, 1.f, 2.f}, {1.f}, {ln2, ln2, ln2}, 3, 1.f);

    EXPECT_NEAR(w.alphas[0], 0.5f, 1e-6f);
    EXPECT_NEAR(w.deltas[2], 1.f, 1e-6f);  // last delta is the sample spacing
    EXPECT_NEAR(w.weights[0], 0.5f, 1e-6f);
    EXPECT_NEAR(w.weights[1], 0.25f, 1e-6f);
    EXPECT_NEAR(w.weights[2], 0.125f, 1e-6f);
    EXPECT_NEAR(w.transmittance[2], 0.25f, 1e-6f);
}

TEST(ComputeWeightsTest, DensityScaleMultipliesSigma) {
    const AlphaWeights a = computeWeights({0.f, 1.f}, {1.f}, {0.2f, 0.2f}, 2, 3.f);
    const AlphaWeights b = computeWeights({0.f, 1.f}, {1.f}, {0.6f, 0.6f}, 2, 1.f);
    EXPECT_NEAR(a.weights[0], b.weights[0], 1e-6f);
    EXPECT_NEAR(a.weights[1], b.weights[1], 1e-6f);
}

TEST(ComputeWeightsTest, WeightSumNeverExceedsOne) {
    std::mt19937 rng(3);
    std::uniform_real_distribution<float> sigmaDist(0.f, 50.f);
    const std::size_t N = 32, T = 24;

    std::vector<float> depths(N * T), spacing(N, 0.1f), sigma(N * T);
    for (std::size_t r = 0; r < N; ++r)
        for (std::size_t t = 0; t < T; ++t) {
            depths[r * T + t] = 1.f + 0.1f * static_cast<float>(t);
            sigma[r * T + t]  = sigmaDist(rng);
        }

    const AlphaWeights w = computeWeights(depths, spacing, sigma, T, 1.f);
    for (std::size_t r = 0; r < N; ++r) {
        float sum = 0.f;
        for (std::size_t t = 0; t < T; ++t) sum += w.weights[r * T + t];
        EXPECT_LE(sum, 1.f + 1e-5f);
    }
}

TEST(ComputeWeightsTest, ShapeMismatchThrows) {
    EXPECT_THROW(computeWeights({0.f, 1.f}, {1.f}, {0.f}, 2, 1.f), std::invalid_argument);
    EXPECT_THROW(computeWeights({0.f, 1.f}, {1.f}, {0.f, 0.f}, 0, 1.f), std::invalid_argument);
}

// ===========================================================================
// Mask
// ===========================================================================

TEST(WeightMaskTest, MaskTakenBeforeZeroing) {
    // second sample sits in near-empty space, third behind an opaque wall
    AlphaWeights w = computeWeights({0.f, 1.f, 2.f}, {1.f}, {0.5f, 1e-6f, 1e3f}, 3, 1.f);

    for (std::size_t k = 0; k < 3; ++k)
        EXPECT_EQ(w.mask[k] != 0, w.weights[k] > kWeightMaskThreshold);
    EXPECT_EQ(w.mask[1], 0);
    EXPECT_GT(w.weights[1], 0.f);

    applyWeightMask(w);
    EXPECT_EQ(w.weights[1], 0.f);
    EXPECT_GT(w.weights[0], 0.f);
}

TEST(WeightMaskTest, MaskedColorsNeverReachImage) {
    RayFixture f;
    f.T = 3;
    f.depths = {0.f, 1.f, 2.f};
    f.spacing = {1.f};
    f.positions.assign(3, glm::vec3(0.f));
    f.rgb = {{0.2f, 0.4f, 0.6f}, {1e6f, 1e6f, 1e6f}, {0.f, 0.f, 0.f}};

    const RenderResult res = Forward(f, {0.5f, 1e-6f, 0.f}, 1.f, glm::vec3(1.f));
    EXPECT_LE(res.image[0].x, 1.f);
    EXPECT_LE(res.image[0].y, 1.f);
    EXPECT_LE(res.image[0].z, 1.f);
}

// ===========================================================================
// Aggregation
// ===========================================================================

TEST(CompositeTest, EmptySpaceShowsBackground) {
    RayFixture f = FourSamples();
    const glm::vec3 bg(0.2f, 0.3f, 0.4f);
    const RenderResult res = Forward(f, {0.f, 0.f, 0.f, 0.f}, 1.f, bg);

    EXPECT_FLOAT_EQ(res.weightSum[0], 0.f);
    EXPECT_FLOAT_EQ(res.image[0].x, bg.x);
    EXPECT_FLOAT_EQ(res.image[0].y, bg.y);
    EXPECT_FLOAT_EQ(res.image[0].z, bg.z);
    EXPECT_FLOAT_EQ(res.depth[0], 0.f);
}

TEST(CompositeTest, OpaqueFirstSample) {
    RayFixture f = FourSamples();
    const RenderResult res = Forward(f, {1e4f, 0.f, 0.f, 0.f}, 1.f, glm::vec3(1.f));

    EXPECT_NEAR(res.weightSum[0], 1.f, 1e-5f);
    EXPECT_NEAR(res.image[0].x, f.rgb[0].x, 1e-5f);
    EXPECT_NEAR(res.depth[0], f.depths[0] / f.norms[0], 1e-5f);
    EXPECT_NEAR(res.depthVariance[0], 0.f, 1e-5f);
    EXPECT_NEAR(res.centroid[0].z, f.positions[0].z, 1e-5f);
}

TEST(CompositeTest, HandComputedAggregates) {
    const float ln2 = std::log(2.f);
    RayFixture f;
    f.T = 3;
    f.depths = {0.f, 1.f, 2.f};
    f.spacing = {1.f};
    f.norms = {2.f};
    f.positions = {{0, 0, 0}, {0, 0, 1}, {0, 0, 2}};
    f.rgb = {{1, 0, 0}, {0, 1, 0}, {0, 0, 1}};

    const RenderResult res = Forward(f, {ln2, ln2, ln2}, 1.f, glm::vec3(0.f));

    // weights 0.5, 0.25, 0.125
    EXPECT_NEAR(res.weightSum[0], 0.875f, 1e-5f);
    EXPECT_NEAR(res.image[0].x, 0.5f, 1e-5f);
    EXPECT_NEAR(res.image[0].y, 0.25f, 1e-5f);
    EXPECT_NEAR(res.image[0].z, 0.125f, 1e-5f);

    const float depth = (0.25f * 1.f + 0.125f * 2.f) / 2.f;
    EXPECT_NEAR(res.depth[0], depth, 1e-5f);
    const float var = 0.5f * depth * depth
                    + 0.25f * (depth - 0.5f) * (depth - 0.5f)
                    + 0.125f * (depth - 1.f) * (depth - 1.f);
    EXPECT_NEAR(res.depthVariance[0], var, 1e-5f);
    EXPECT_NEAR(res.centroid[0].z, 0.5f, 1e-5f);

    ASSERT_EQ(res.rgbPerSample.size(), 3u);
    EXPECT_FLOAT_EQ(res.rgbPerSample[2].z, 1.f);
}

TEST(CompositeTest, AuxiliaryFeatureIsWeightedSum) {
    const float ln2 = std::log(2.f);
    AlphaWeights w = computeWeights({0.f, 1.f}, {1.f}, {ln2, ln2}, 2, 1.f);
    applyWeightMask(w);
    const std::vector<float> aux = {1.f, 2.f,   4.f, 8.f};  // [2 samples x 2]

    const RenderResult res = composite(w, {0.f, 1.f}, {glm::vec3(0.f), glm::vec3(0.f)},
                                       {glm::vec3(0.f), glm::vec3(0.f)}, aux, 2, {1.f},
                                       glm::vec3(1.f));
    ASSERT_EQ(res.auxFeature.size(), 2u);
    EXPECT_NEAR(res.auxFeature[0], 0.5f * 1.f + 0.25f * 4.f, 1e-5f);
    EXPECT_NEAR(res.auxFeature[1], 0.5f * 2.f + 0.25f * 8.f, 1e-5f);
}

// ===========================================================================
// Backward
// ===========================================================================

TEST(CompositeBackwardTest, MatchesFiniteDifferences) {
    const RayFixture f = FourSamples();
    const float scale = 1.5f;
    const glm::vec3 bg(0.3f, 0.6f, 0.9f);

    RayGradients up;
    up.image    = {glm::vec3(0.7f, -0.4f, 0.2f)};
    up.depth    = {0.9f};
    up.centroid = {glm::vec3(0.1f, 0.3f, -0.5f)};

    auto loss = [&](const std::vector<float>& sigma) {
        const RenderResult r = Forward(f, sigma, scale, bg);
        return glm::dot(up.image[0], r.image[0]) + up.depth[0] * r.depth[0]
             + glm::dot(up.centroid[0], r.centroid[0]);
    };

    AlphaWeights w = computeWeights(f.depths, f.spacing, f.sigma, f.T, scale);
    for (uint8_t m : w.mask) ASSERT_EQ(m, 1);
    applyWeightMask(w);
    const SampleGradients g = compositeBackward(w, f.depths, f.positions, f.rgb, 0, f.norms, bg, scale, up);

    const float h = 1e-3f;
    for (std::size_t k = 0; k < f.T; ++k) {
        std::vector<float> plus = f.sigma, minus = f.sigma;
        plus[k] += h;
        minus[k] -= h;
        const float numeric = (loss(plus) - loss(minus)) / (2.f * h);
        EXPECT_NEAR(g.sigma[k], numeric, 2e-3f) << "sample " << k;
    }

    // rgb sensitivity is the live weight times the image gradient
    for (std::size_t k = 0; k < f.T; ++k)
        EXPECT_NEAR(g.rgb[k].x, up.image[0].x * w.weights[k], 1e-6f);
}

TEST(CompositeBackwardTest, MaskedOutSampleStillDimsLaterOnes) {
    RayFixture f = FourSamples();
    f.rgb.assign(f.T, glm::vec3(1.f));
    const float scale = 1.5f;
    const glm::vec3 bg(0.f);
    // delta_0 * scale = 0.45, so alpha_0 stays below the mask threshold
    const std::vector<float> sigma = {1e-4f, 3.f, 1.f, 2.f};
    const float h = 8e-5f;

    RayGradients up;
    up.image = {glm::vec3(1.f)};

    auto loss = [&](const std::vector<float>& s) {
        const RenderResult r = Forward(f, s, scale, bg);
        return glm::dot(up.image[0], r.image[0]);
    };

    AlphaWeights w = computeWeights(f.depths, f.spacing, sigma, f.T, scale);
    ASSERT_EQ(w.mask[0], 0);
    for (std::size_t k = 1; k < f.T; ++k) ASSERT_EQ(w.mask[k], 1);
    for (float s0 : {sigma[0] - h, sigma[0] + h})
        ASSERT_EQ(computeWeights(f.depths, f.spacing, {s0, 3.f, 1.f, 2.f}, f.T, scale).mask[0], 0);

    applyWeightMask(w);
    const SampleGradients g = compositeBackward(w, f.depths, f.positions, f.rgb, 0, f.norms, bg, scale, up);

    // dL/dsigma_0 = -delta_0 * scale * sum_{k>0} dL/dw_k * w_k, with dL/dw_k = 3
    const float laterWeight = w.weights[1] + w.weights[2] + w.weights[3];
    EXPECT_NEAR(g.sigma[0], -0.45f * 3.f * laterWeight, 1e-4f);
    EXPECT_FLOAT_EQ(g.rgb[0].x, 0.f);

    std::vector<float> plus = sigma, minus = sigma;
    plus[0] += h;
    minus[0] -= h;
    const float numeric = (loss(plus) - loss(minus)) / (2.f * h);
    EXPECT_NEAR(g.sigma[0], numeric, 2e-2f);
}

TEST(CompositeBackwardTest, DepthVarianceHasNoSensitivity) {
    const RayFixture f = FourSamples();
    AlphaWeights w = computeWeights(f.depths, f.spacing, f.sigma, f.T, 1.f);
    applyWeightMask(w);

    RayGradients up;
    up.depthVariance = {1.f};
    const SampleGradients g = compositeBackward(w, f.depths, f.positions, f.rgb, 0, f.norms,
                                                glm::vec3(1.f), 1.f, up);
    for (float s : g.sigma) EXPECT_EQ(s, 0.f);
    for (const auto& c : g.rgb) EXPECT_EQ(c, glm::vec3(0.f));
}

TEST(CompositeBackwardTest, AuxiliaryPathStopsAtWeights) {
    const RayFixture f = FourSamples();
    AlphaWeights w = computeWeights(f.depths, f.spacing, f.sigma, f.T, 1.f);
    applyWeightMask(w);

    RayGradients up;
    up.auxFeature = {2.f};
    const SampleGradients g = compositeBackward(w, f.depths, f.positions, f.rgb, 1, f.norms,
                                                glm::vec3(1.f), 1.f, up);
    for (std::size_t k = 0; k < f.T; ++k) {
        EXPECT_EQ(g.sigma[k], 0.f);
        EXPECT_NEAR(g.aux[k], 2.f * w.weights[k], 1e-6f);
    }
}

TEST(CompositeBackwardTest, MaskedSamplesGetNoColorSensitivity) {
    RayFixture f = FourSamples();
    f.sigma = {1e4f, 0.5f, 0.5f, 0.5f};  // everything behind the first sample is masked
    AlphaWeights w = computeWeights(f.depths, f.spacing, f.sigma, f.T, 1.f);
    applyWeightMask(w);

    RayGradients up;
    up.image = {glm::vec3(1.f)};
    const SampleGradients g = compositeBackward(w, f.depths, f.positions, f.rgb, 0, f.norms,
                                                glm::vec3(1.f), 1.f, up);
    for (std::size_t k = 1; k < f.T; ++k) {
        EXPECT_EQ(w.mask[k], 0);
        EXPECT_EQ(g.rgb[k], glm::vec3(0.f));
    }
}
