#pragma once
#include <memory>

#include <spdlog/spdlog.h>

namespace nerfgrid::util {

// Shared "nerfgrid" console logger, created on first use.
std::shared_ptr<spdlog::logger> logger();

}  // namespace nerfgrid::util
