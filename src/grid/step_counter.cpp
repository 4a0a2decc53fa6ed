#include "grid/step_counter.hpp"

#include <algorithm>

namespace nerfgrid::grid {

void StepCounter::record(int32_t steps, int32_t rays) {
  slots_[localStep_ % slots_.size()] = {steps, rays};
  ++localStep_;
}

void StepCounter::consume() {
  const std::size_t total = std::min(slots_.size(), localStep_);
  if (total > 0) {
    int64_t sum = 0;
    for (std::size_t i = 0; i < total; ++i) sum += slots_[i][0];
    meanSteps_ = static_cast<uint32_t>(sum / static_cast<int64_t>(total));
  }
  localStep_ = 0;
}

void StepCounter::reset() {
  slots_ = Slots{};
  localStep_ = 0;
  meanSteps_ = 0;
}

}  // namespace nerfgrid::grid
