#include "field/field.hpp"

#include "util/errors.hpp"

namespace nerfgrid::field {

DensityOutput Field::density(const std::vector<glm::vec3>&) const {
  throw NotImplementedError("Field::density on an unconfigured field");
}

std::vector<glm::vec3> Field::color(const std::vector<glm::vec3>&,
                                    const std::vector<glm::vec3>&,
                                    const std::vector<uint8_t>&,
                                    const std::vector<float>&,
                                    const std::vector<float>&) const {
  throw NotImplementedError("Field::color on an unconfigured field");
}

std::vector<float> Field::auxHead(const std::vector<float>&,
                                  const std::vector<float>&) const {
  throw NotImplementedError("Field::auxHead on an unconfigured field");
}

}  // namespace nerfgrid::field
