#include "field/sphere_field.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace nerfgrid::field {

SphereField::SphereField(std::vector<SoftSphere> spheres, float edgeWidth)
  : spheres_(std::move(spheres)),
    edgeWidth_(edgeWidth) {
  if (edgeWidth_ <= 0.f) throw std::invalid_argument("SphereField: edgeWidth must be positive");
}

float SphereField::occupancy(const SoftSphere& s, const glm::vec3& p) const {
  const float inside = (s.radius - glm::length(p - s.center)) / (edgeWidth_ * s.radius);
  return std::clamp(inside, 0.f, 1.f);
}

DensityOutput SphereField::density(const std::vector<glm::vec3>& positions) const {
  const std::size_t F = featureDim();
  DensityOutput out;
  out.sigma.assign(positions.size(), 0.f);
  out.features.assign(positions.size() * F, 0.f);

  for (std::size_t m = 0; m < positions.size(); ++m) {
    for (std::size_t k = 0; k < spheres_.size(); ++k) {
      const float occ = occupancy(spheres_[k], positions[m]);
      out.features[m * F + k] = occ;
      out.sigma[m] += occ * spheres_[k].density;
    }
  }
  return out;
}

std::vector<glm::vec3> SphereField::color(const std::vector<glm::vec3>& positions,
                                          const std::vector<glm::vec3>&,
                                          const std::vector<uint8_t>&   mask,
                                          const std::vector<float>&     features,
                                          const std::vector<float>&) const {
  const std::size_t F = featureDim();
  std::vector<glm::vec3> rgb(positions.size(), glm::vec3(0.f));

  for (std::size_t m = 0; m < positions.size(); ++m) {
    if (!mask.empty() && !mask[m]) continue;
    float total = 0.f;
    glm::vec3 c(0.f);
    for (std::size_t k = 0; k < spheres_.size(); ++k) {
      const float w = features[m * F + k] * spheres_[k].density;
      c += w * spheres_[k].rgb;
      total += w;
    }
    if (total > 0.f) rgb[m] = c / total;
  }
  return rgb;
}

std::vector<float> SphereField::auxHead(const std::vector<float>& features,
                                        const std::vector<float>& sigma) const {
  const std::size_t F = featureDim();
  const std::size_t A = auxDim();
  std::vector<float> aux(sigma.size() * A);
  for (std::size_t m = 0; m < sigma.size(); ++m) {
    aux[m * A] = sigma[m];
    std::copy_n(features.begin() + m * F, F, aux.begin() + m * A + 1);
  }
  return aux;
}

}  // namespace nerfgrid::field
