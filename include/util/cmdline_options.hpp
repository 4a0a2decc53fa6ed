#pragma once
#include <cstddef>
#include <optional>
#include <string>

#include <glm/vec3.hpp>

namespace nerfgrid::cli {

struct CliOptions {
  std::string optionsPath;                 // renderer options file, empty = defaults
  std::string outputPath = "nerfgrid_state.h5";
  std::string loadPath;                    // state to resume from, empty = fresh grid

  std::size_t width     = 256;
  std::size_t height    = 256;
  float       fovDeg    = 50.f;
  std::size_t numSteps  = 256;
  std::size_t refreshes = 16;
  std::size_t cameras   = 32;              // orbit cameras used for visibility marking

  bool        staged      = false;
  std::size_t maxRayBatch = 4096;
  bool        perturb     = false;
  std::optional<glm::vec3> background;

  bool enableDebug = false;
};

// Parse argv into CliOptions. Exits after printing help if --help is given.
CliOptions parseOptions(int argc, char** argv);

} // namespace nerfgrid::cli
