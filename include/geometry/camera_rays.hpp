#pragma once
#include <cstddef>

#include <glm/mat4x4.hpp>

#include "geometry/primitives.hpp"

namespace nerfgrid::geometry {

/**
 *  Pinhole rays for every pixel of a width x height image, row-major.
 *
 *  The pose is camera-to-world with the camera looking down +z (x right,
 *  y down in the image). Directions are unit length; directionNorms hold
 *  |((i+0.5-cx)/fx, (j+0.5-cy)/fy, 1)| so that depth / norm is the depth
 *  along the camera axis.
 */
RayBatch generateRays(const glm::mat4& cameraToWorld, const Intrinsics& intrinsics,
                      std::size_t height, std::size_t width);

// Intrinsics of a camera with the given vertical field of view (radians).
Intrinsics intrinsicsFromFov(float fovY, std::size_t height, std::size_t width);

// Camera-to-world pose at eye, looking at target (camera +z towards target).
glm::mat4 lookAtPose(const glm::vec3& eye, const glm::vec3& target,
                     const glm::vec3& up = glm::vec3(0.f, 1.f, 0.f));

}  // namespace nerfgrid::geometry
