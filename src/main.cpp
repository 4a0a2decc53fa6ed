#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <utility>
#include <memory>
#include <vector>

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <opencv2/opencv.hpp>

#include "config/render_config.hpp"
#include "field/sphere_field.hpp"
#include "geometry/camera_rays.hpp"
#include "io/state_io.hpp"
#include "render/volume_renderer.hpp"
#include "util/cmdline_options.hpp"
#include "util/debug_utils.hpp"
#include "util/logging.hpp"
#include "util/options_file.hpp"

using namespace nerfgrid;
using namespace nerfgrid::geometry;
using nerfgrid::util::logger;

static std::vector<field::SoftSphere> DefaultScene() {
  return {
    {glm::vec3( 0.00f, 0.00f,  0.00f), 0.45f, 20.f, glm::vec3(0.85f, 0.25f, 0.20f)},
    {glm::vec3( 0.55f, 0.10f,  0.30f), 0.25f, 30.f, glm::vec3(0.20f, 0.70f, 0.30f)},
    {glm::vec3(-0.50f, -0.20f, 0.35f), 0.20f, 40.f, glm::vec3(0.20f, 0.35f, 0.90f)},
  };
}

// Cameras on a ring around the origin, tilted slightly downwards.
static std::vector<glm::mat4> OrbitPoses(std::size_t n, float radius) {
  std::vector<glm::mat4> poses;
  for (std::size_t i = 0; i < n; ++i) {
    const float phi = glm::two_pi<float>() * static_cast<float>(i) / static_cast<float>(n);
    const glm::vec3 eye(radius * std::cos(phi), 0.35f * radius, radius * std::sin(phi));
    poses.push_back(lookAtPose(eye, glm::vec3(0.f)));
  }
  return poses;
}

static std::pair<cv::Mat, cv::Mat> AssembleImages(const render::RenderResult& res,
                                                  std::size_t height, std::size_t width)
{
  const int W = static_cast<int>(width);
  const int H = static_cast<int>(height);

  cv::Mat rgb_img   (H, W, CV_8UC3, cv::Scalar(0,0,0));
  cv::Mat depth_img;
  cv::Mat depth_gray(H, W, CV_8UC1, cv::Scalar(0));

  float maxDepth = 0.f;
  for (std::size_t i = 0; i < res.size(); ++i)
    if (res.weightSum[i] > 0.5f) maxDepth = std::max(maxDepth, res.depth[i]);
  if (maxDepth <= 0.f) maxDepth = 1.f;

  #pragma omp parallel for schedule(static)
  for (ptrdiff_t y = 0; y < static_cast<ptrdiff_t>(H); ++y) {
    uint8_t* dstRGB  = rgb_img.ptr<uint8_t>(static_cast<int>(y));
    uint8_t* dstGray = depth_gray.ptr<uint8_t>(static_cast<int>(y));
    for (int x = 0; x < W; ++x) {
      const std::size_t i = static_cast<std::size_t>(y) * width + static_cast<std::size_t>(x);
      const glm::vec3 c = glm::clamp(res.image[i], 0.f, 1.f);
      uint8_t* rgb = dstRGB + x*3;
      rgb[2] = static_cast<uint8_t>(std::lround(c.r * 255.f));
      rgb[1] = static_cast<uint8_t>(std::lround(c.g * 255.f));
      rgb[0] = static_cast<uint8_t>(std::lround(c.b * 255.f));

      // Grayscale depth 0..255 from the expected depth, weighted by opacity
      const float norm = std::min(1.f, res.depth[i] / maxDepth) * std::min(1.f, res.weightSum[i]);
      dstGray[x] = static_cast<uint8_t>(std::lround(norm * 255.f));
    }
  }

  cv::applyColorMap(255-depth_gray, depth_img, cv::COLORMAP_TURBO);

  return {rgb_img, depth_img};
}

static int Run(const cli::CliOptions& opt) {
  render::RendererOptions rendererOptions;
  if (!opt.optionsPath.empty()) {
    if (util::LoadOptionsFromFile(rendererOptions, opt.optionsPath)) {
      logger()->info("Loaded renderer options from {}", opt.optionsPath);
    } else {
      logger()->warn("No renderer options loaded (file not found or unreadable): {}", opt.optionsPath);
    }
  }

  std::vector<field::SoftSphere> scene = DefaultScene();
  if (!opt.loadPath.empty()) {
    auto stored = io::loadSpheres(opt.loadPath);
    if (!stored.empty()) scene = std::move(stored);
  }

  auto sphereField = std::make_shared<const field::SphereField>(scene);
  render::VolumeRenderer renderer(sphereField, rendererOptions);

  if (!opt.loadPath.empty())
    io::loadState(renderer, opt.loadPath);

  // ------------------------------
  // Occupancy grid maintenance
  // ------------------------------
  const float orbitRadius = 3.f * renderer.options().bound;
  const Intrinsics intrinsics = intrinsicsFromFov(glm::radians(opt.fovDeg), opt.height, opt.width);

  if (opt.cameras > 0 && opt.loadPath.empty()) {
    const auto poses = OrbitPoses(opt.cameras, orbitRadius);
    logger()->debug("First orbit pose:\n{}", poses.front());
    renderer.markUntrainedGrid(poses, intrinsics);
  }

  renderer.setTraining(true);
  for (std::size_t i = 0; i < opt.refreshes; ++i)
    renderer.refreshOccupancy();
  renderer.setTraining(false);

  logger()->info("Occupancy after {} refreshes: mean density {:.4f}, {} occupied cells",
                 renderer.grid().refreshCount(), renderer.grid().meanDensity(),
                 renderer.grid().occupiedCount());
  logger()->debug("Bitfield head: {}", util::VectorSliceToString(renderer.grid().bitfield(), 0, 16));

  // ------------------------------
  // Render one view
  // ------------------------------
  render::RenderOptions ro;
  ro.staged          = opt.staged;
  ro.maxRayBatch     = opt.maxRayBatch;
  ro.perturb         = opt.perturb;
  ro.numSteps        = opt.numSteps;
  ro.backgroundColor = opt.background;

  const glm::mat4 pose = lookAtPose(glm::vec3(0.f, 0.35f * orbitRadius, -orbitRadius), glm::vec3(0.f));
  logger()->info("Rendering {}x{} view from {}", opt.width, opt.height, glm::vec3(pose[3]));
  const render::RenderResult res = renderer.renderFromPose(pose, intrinsics, opt.height, opt.width, ro);

  auto [rgbMat, depthMat] = AssembleImages(res, opt.height, opt.width);
  if (!cv::imwrite("rgb_image.png", rgbMat))
    throw std::runtime_error("Failed to write rgb_image.png");
  if (!cv::imwrite("depth_image.png", depthMat))
    throw std::runtime_error("Failed to write depth_image.png");
  logger()->info("Wrote rgb_image.png and depth_image.png ({}x{})", opt.width, opt.height);

  io::saveState(renderer, opt.outputPath, scene);
  return 0;
}

int main(int argc, char** argv) {
  try {
    const cli::CliOptions opt = cli::parseOptions(argc, argv);
    if (opt.enableDebug) logger()->set_level(spdlog::level::debug);
    return Run(opt);
  } catch (const std::exception& e) {
    logger()->error("{}", e.what());
    return 1;
  }
}
