#include "util/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace nerfgrid::util {

std::shared_ptr<spdlog::logger> logger() {
  static std::shared_ptr<spdlog::logger> instance = [] {
    auto existing = spdlog::get("nerfgrid");
    if (existing) return existing;
    auto l = spdlog::stdout_color_mt("nerfgrid");
    l->set_pattern("[%H:%M:%S.%e] [%n] [%^%l%$] %v");
    return l;
  }();
  return instance;
}

}  // namespace nerfgrid::util
