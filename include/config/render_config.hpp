// render_config.hpp
#pragma once

#include <cstddef>
#include <cstdint>

namespace nerfgrid::config {
// ============================================================================
// Occupancy grid
// ============================================================================

// Cells per axis of every cascade
inline constexpr std::size_t kDefaultGridSize = 128;
inline constexpr std::size_t kMaxGridSize     = 1024;  // 10 bits per axis, 30-bit Morton index

// Sentinel for cells no training camera ever sees
inline constexpr float kExcludedCell = -1.0f;

// Refresh schedule
inline constexpr std::size_t kWarmupRefreshes = 16;    // full sweeps before partial updates
inline constexpr float       kDefaultDecay    = 0.95f;
inline constexpr std::size_t kRefreshBatch    = 128;   // coordinates per axis per block
inline constexpr std::size_t kMarkBatch       = 64;    // cameras / coordinates per block

inline constexpr float kDefaultDensityThreshold = 0.01f;

// Step counter ring buffer
inline constexpr std::size_t kStepCounterSlots = 16;

// ============================================================================
// Ray setup & sampling
// ============================================================================

inline constexpr float kDefaultMinNear   = 0.2f;
inline constexpr float kMaxDistance      = 100.0f;  // near/far of rays that miss the box
inline constexpr float kDirectionEpsilon = 1e-15f;

inline constexpr std::size_t kDefaultNumSteps   = 256;
inline constexpr std::size_t kDefaultMaxRayBatch = 4096;

// ============================================================================
// Compositing
// ============================================================================

inline constexpr float kWeightMaskThreshold   = 1e-4f;  // samples below this never query color
inline constexpr float kTransmittanceEpsilon  = 1e-15f;
inline constexpr float kDefaultDensityScale   = 1.0f;

// ============================================================================
// Importance resampling
// ============================================================================

inline constexpr float kPdfWeightEpsilon = 1e-5f;
inline constexpr float kCdfSpanEpsilon   = 1e-5f;

// Sanity checks
static_assert((kDefaultGridSize & (kDefaultGridSize - 1)) == 0,
              "Grid size must be a power of two.");
static_assert(kDefaultGridSize <= kMaxGridSize,
              "Grid size exceeds Morton index range.");
static_assert(kStepCounterSlots == 16,
              "Step counter averaging assumes 16 slots.");

}  // namespace nerfgrid::config
