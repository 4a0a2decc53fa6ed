#pragma once
#include <stdexcept>
#include <string>

namespace nerfgrid {

// A code path that exists in the interface but has no implementation here:
// unconfigured field queries, the accelerated marching path, background-field
// blending.
class NotImplementedError : public std::logic_error {
public:
  explicit NotImplementedError(const std::string& what)
    : std::logic_error("not implemented: " + what) {}
};

}  // namespace nerfgrid
