#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

namespace nerfgrid::field {

// sigma: [M], features: [M x featureDim()] row-major
struct DensityOutput {
  std::vector<float> sigma;
  std::vector<float> features;
};

/**
 *  Query boundary to a density / color / auxiliary-feature field.
 *
 *  The base class is an unconfigured field: every query throws
 *  NotImplementedError. Concrete fields override the queries and report
 *  fixed feature widths for their whole lifetime.
 *
 *  mask passed to color() is a hint; entries with mask == 0 get zero weight
 *  in the compositor whatever the field returns for them.
 */
class Field {
public:
  virtual ~Field() = default;

  virtual std::size_t featureDim() const { return 0; }
  virtual std::size_t auxDim() const { return 0; }

  virtual DensityOutput density(const std::vector<glm::vec3>& positions) const;

  virtual std::vector<glm::vec3> color(const std::vector<glm::vec3>& positions,
                                       const std::vector<glm::vec3>& directions,
                                       const std::vector<uint8_t>&   mask,
                                       const std::vector<float>&     features,
                                       const std::vector<float>&     sigma) const;

  // [M x auxDim()] row-major
  virtual std::vector<float> auxHead(const std::vector<float>& features,
                                     const std::vector<float>& sigma) const;
};

}  // namespace nerfgrid::field
