#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

#include "config/render_config.hpp"

namespace nerfgrid::grid {

// Ring buffer of (stepsUsed, raysProcessed) written by an external marcher
// during training, one slot per marching call.
class StepCounter {
public:
  using Slot  = std::array<int32_t, 2>;
  using Slots = std::array<Slot, config::kStepCounterSlots>;

  void record(int32_t steps, int32_t rays);

  // Mean of stepsUsed over the slots written since the last consume()
  // (at most kStepCounterSlots), then rewinds the write cursor. Leaves the
  // previous mean in place when nothing was recorded.
  void consume();

  void reset();

  uint32_t    meanSteps() const { return meanSteps_; }
  std::size_t localStep() const { return localStep_; }
  const Slots& slots() const { return slots_; }
  void restore(const Slots& slots) { slots_ = slots; }

private:
  Slots       slots_{};
  std::size_t localStep_ = 0;
  uint32_t    meanSteps_ = 0;
};

}  // namespace nerfgrid::grid
