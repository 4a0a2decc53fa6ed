#include "render/volume_renderer.hpp"

#include <algorithm>
#include <shared_mutex>
#include <stdexcept>
#include <string>

#include "geometry/camera_rays.hpp"
#include "geometry/sampling.hpp"
#include "render/compositor.hpp"
#include "util/errors.hpp"
#include "util/logging.hpp"

// Utility macro for logging inside the class implementation
#define NG_LOG(...) nerfgrid::util::logger()->info(__VA_ARGS__)

using namespace nerfgrid::render;
using namespace nerfgrid::geometry;
using namespace nerfgrid::config;
using nerfgrid::util::logger;

static RendererOptions resolveBound(RendererOptions o) {
  if (o.sceneBox) {
    const glm::vec3 side = o.sceneBox->max - o.sceneBox->min;
    o.bound = std::max(side.x, std::max(side.y, side.z));
  }
  if (!(o.bound > 0.f))
    throw std::invalid_argument("RendererOptions: bound must be positive");
  return o;
}

static void checkSize(const char* what, std::size_t got, std::size_t expected) {
  if (got != expected)
    throw std::runtime_error(std::string("Field ") + what + " returned " + std::to_string(got)
                             + " values, expected " + std::to_string(expected));
}

VolumeRenderer::VolumeRenderer(std::shared_ptr<const field::Field> field, const RendererOptions& options)
  : options_(resolveBound(options)),
    field_(std::move(field)),
    aabbTrain_(Aabb::cube(options_.bound)),
    aabbInfer_(Aabb::cube(options_.bound)),
    grid_(options_.bound, options_.gridSize, options_.densityScale,
          options_.densityThreshold, options_.seed),
    seedRng_(options_.seed) {
  if (!field_) throw std::invalid_argument("VolumeRenderer: field must not be null");
  NG_LOG("Volume renderer: bound={} densityScale={} minNear={} featureDim={} auxDim={}",
         options_.bound, options_.densityScale, options_.minNear,
         field_->featureDim(), field_->auxDim());
}

uint32_t VolumeRenderer::nextCallSeed() {
  std::lock_guard<std::mutex> lock(seedMutex_);
  return static_cast<uint32_t>(seedRng_());
}

// ─────────────────────────────────────────────────────────────────────────────
//  render() – single pass or staged over chunks of maxRayBatch rays
// ─────────────────────────────────────────────────────────────────────────────
RenderResult VolumeRenderer::render(const RayBatch& rays, const RenderOptions& options) {
  if (options_.accelerated)
    throw NotImplementedError("compacted adaptive ray marching");
  if (options_.backgroundRadius > 0.f)
    throw NotImplementedError("background-field blending (backgroundRadius > 0)");
  if (options.upsampleSteps != 0)
    throw std::invalid_argument("render: upsampleSteps must be 0, got "
                                + std::to_string(options.upsampleSteps));
  if (options.numSteps == 0)
    throw std::invalid_argument("render: numSteps must be >= 1");
  rays.validate();

  auto lock = grid_.readLock();
  std::mt19937 rng(nextCallSeed());

  if (!options.staged)
    return run(rays, options, rng);

  if (options.maxRayBatch == 0)
    throw std::invalid_argument("render: maxRayBatch must be >= 1");

  const std::size_t n = rays.size();
  RenderResult out;
  out.allocate(n, options.numSteps, field_->auxDim());

  for (std::size_t head = 0; head < n; head += options.maxRayBatch) {
    const std::size_t tail = std::min(head + options.maxRayBatch, n);
    logger()->debug("Staged render: rays [{}, {}) of {}", head, tail, n);
    out.assignSlice(head, run(rays.slice(head, tail), options, rng));
  }
  return out;
}

RenderResult VolumeRenderer::run(const RayBatch& rays, const RenderOptions& options, std::mt19937& rng) const {
  const std::size_t T = options.numSteps;
  const std::size_t M = rays.size() * T;
  const std::size_t F = field_->featureDim();
  const std::size_t A = field_->auxDim();
  // caller holds the grid read lock
  const Aabb aabb = training_ ? aabbTrain_ : aabbInfer_;

  // Sample
  const std::vector<NearFar> nearFar = nearFarFromAabb(rays, aabb, options_.minNear);
  std::vector<float> spacing;
  const std::vector<float> depths =
      stratifiedDepths(nearFar, T, options.perturb ? &rng : nullptr, spacing);
  const std::vector<glm::vec3> positions = samplePositions(rays, depths, T, aabb);

  // Density query, then the mask decides which samples get a color query
  const field::DensityOutput density = field_->density(positions);
  checkSize("density", density.sigma.size(), M);
  checkSize("features", density.features.size(), M * F);

  AlphaWeights w = computeWeights(depths, spacing, density.sigma, T, options_.densityScale);

  std::vector<glm::vec3> directions(M);
  for (std::size_t r = 0; r < rays.size(); ++r)
    std::fill_n(directions.begin() + r * T, T, rays.directions[r]);

  const std::vector<glm::vec3> rgb =
      field_->color(positions, directions, w.mask, density.features, density.sigma);
  checkSize("color", rgb.size(), M);
  applyWeightMask(w);

  std::vector<float> aux;
  if (A > 0) {
    aux = field_->auxHead(density.features, density.sigma);
    checkSize("auxHead", aux.size(), M * A);
  }

  const glm::vec3 background = options.backgroundColor.value_or(glm::vec3(1.f));
  return composite(w, depths, positions, rgb, aux, A, rays.directionNorms, background);
}

RenderResult VolumeRenderer::renderFromPose(const glm::mat4& cameraToWorld,
                                            const Intrinsics& intrinsics,
                                            std::size_t height, std::size_t width,
                                            const RenderOptions& options) {
  return render(generateRays(cameraToWorld, intrinsics, height, width), options);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Maintenance – forwarded to the grid, which takes its own exclusive lock
// ─────────────────────────────────────────────────────────────────────────────
void VolumeRenderer::markUntrainedGrid(const std::vector<glm::mat4>& cameraToWorld,
                                       const Intrinsics& intrinsics,
                                       std::size_t batchSize) {
  grid_.markUntrainedGrid(cameraToWorld, intrinsics, batchSize);
}

void VolumeRenderer::refreshOccupancy(float decay, std::size_t batchSize) {
  grid_.refresh(*field_, decay, batchSize);
}

void VolumeRenderer::reset() {
  grid_.reset();
}

void VolumeRenderer::recordSteps(int32_t steps, int32_t rays) {
  grid_.recordSteps(steps, rays);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Mode and boxes – written under the grid's exclusive lock
// ─────────────────────────────────────────────────────────────────────────────
void VolumeRenderer::setTraining(bool training) {
  auto lock = grid_.writeLock();
  training_ = training;
}

bool VolumeRenderer::training() const {
  auto lock = grid_.readLock();
  return training_;
}

Aabb VolumeRenderer::aabbTrain() const {
  auto lock = grid_.readLock();
  return aabbTrain_;
}

Aabb VolumeRenderer::aabbInfer() const {
  auto lock = grid_.readLock();
  return aabbInfer_;
}

void VolumeRenderer::setAabbTrain(const Aabb& box) {
  auto lock = grid_.writeLock();
  aabbTrain_ = box;
}

void VolumeRenderer::setAabbInfer(const Aabb& box) {
  auto lock = grid_.writeLock();
  aabbInfer_ = box;
}

RendererState VolumeRenderer::exportState() const {
  auto lock = grid_.readLock();
  return RendererState{grid_.exportStateLocked(), aabbTrain_, aabbInfer_};
}

void VolumeRenderer::importState(const RendererState& state) {
  auto lock = grid_.writeLock();
  grid_.importStateLocked(state.grid);
  aabbTrain_ = state.aabbTrain;
  aabbInfer_ = state.aabbInfer;
}
