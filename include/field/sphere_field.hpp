#pragma once
#include <vector>

#include <glm/glm.hpp>

#include "field/field.hpp"

namespace nerfgrid::field {

struct SoftSphere {
  glm::vec3 center{0.f};
  float     radius  = 0.5f;
  float     density = 10.f;
  glm::vec3 rgb{1.f, 0.f, 0.f};
};

// Analytic scene of soft-edged spheres. One feature channel per sphere
// (its occupancy in [0, 1]); auxHead returns [sigma, features...].
class SphereField final : public Field {
public:
  explicit SphereField(std::vector<SoftSphere> spheres, float edgeWidth = 0.1f);

  std::size_t featureDim() const override { return spheres_.empty() ? 1 : spheres_.size(); }
  std::size_t auxDim() const override { return featureDim() + 1; }

  DensityOutput density(const std::vector<glm::vec3>& positions) const override;

  std::vector<glm::vec3> color(const std::vector<glm::vec3>& positions,
                               const std::vector<glm::vec3>& directions,
                               const std::vector<uint8_t>&   mask,
                               const std::vector<float>&     features,
                               const std::vector<float>&     sigma) const override;

  std::vector<float> auxHead(const std::vector<float>& features,
                             const std::vector<float>& sigma) const override;

  const std::vector<SoftSphere>& spheres() const { return spheres_; }

private:
  float occupancy(const SoftSphere& s, const glm::vec3& p) const;

  std::vector<SoftSphere> spheres_;
  float edgeWidth_;
};

}  // namespace nerfgrid::field
