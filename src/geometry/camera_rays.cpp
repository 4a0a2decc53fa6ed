#include "geometry/camera_rays.hpp"

#include <cmath>
#include <stdexcept>

#include <glm/glm.hpp>

namespace nerfgrid::geometry {

RayBatch generateRays(const glm::mat4& cameraToWorld, const Intrinsics& intrinsics,
                      std::size_t height, std::size_t width) {
  if (intrinsics.fx == 0.f || intrinsics.fy == 0.f)
    throw std::invalid_argument("generateRays: focal length must be non-zero");

  const glm::mat3 R(cameraToWorld);
  const glm::vec3 origin(cameraToWorld[3]);

  RayBatch rays;
  const std::size_t n = height * width;
  rays.origins.assign(n, origin);
  rays.directions.resize(n);
  rays.directionNorms.resize(n);

  for (std::size_t j = 0; j < height; ++j) {
    for (std::size_t i = 0; i < width; ++i) {
      const glm::vec3 cam((static_cast<float>(i) + 0.5f - intrinsics.cx) / intrinsics.fx,
                          (static_cast<float>(j) + 0.5f - intrinsics.cy) / intrinsics.fy,
                          1.f);
      const float norm = glm::length(cam);
      const std::size_t k = j * width + i;
      rays.directions[k]     = R * (cam / norm);
      rays.directionNorms[k] = norm;
    }
  }
  return rays;
}

Intrinsics intrinsicsFromFov(float fovY, std::size_t height, std::size_t width) {
  const float f = 0.5f * static_cast<float>(height) / std::tan(0.5f * fovY);
  return Intrinsics{f, f, 0.5f * static_cast<float>(width), 0.5f * static_cast<float>(height)};
}

glm::mat4 lookAtPose(const glm::vec3& eye, const glm::vec3& target, const glm::vec3& up) {
  const glm::vec3 forward = glm::normalize(target - eye);
  glm::vec3 right = glm::cross(forward, up);
  if (glm::length(right) < 1e-6f) right = glm::cross(forward, glm::vec3(1.f, 0.f, 0.f));
  right = glm::normalize(right);
  // image y runs down
  const glm::vec3 down = glm::cross(forward, right);

  glm::mat4 pose(1.f);
  pose[0] = glm::vec4(right, 0.f);
  pose[1] = glm::vec4(down, 0.f);
  pose[2] = glm::vec4(forward, 0.f);
  pose[3] = glm::vec4(eye, 1.f);
  return pose;
}

}  // namespace nerfgrid::geometry
