#include "util/cmdline_options.hpp"
#include <cxxopts.hpp>
#include <algorithm>
#include <cstdlib>
#include <iostream>

#include "config/render_config.hpp"
#include "util/options_file.hpp"

namespace nerfgrid::cli {

CliOptions parseOptions(int argc, char** argv) {
  cxxopts::Options options("nerfgrid_render", "Volumetric renderer with an occupancy grid");
  options.add_options()
    ("options", "Renderer options file (key=value)",
      cxxopts::value<std::string>()->default_value(""))
    ("o,output", "HDF5 file the grid state is saved to",
      cxxopts::value<std::string>()->default_value("nerfgrid_state.h5"))
    ("load", "HDF5 state to resume from",
      cxxopts::value<std::string>()->default_value(""))

    ("W,width", "Image width",
      cxxopts::value<std::size_t>()->default_value("256"))
    ("H,height", "Image height",
      cxxopts::value<std::size_t>()->default_value("256"))
    ("fov", "Vertical field of view in degrees",
      cxxopts::value<float>()->default_value("50"))
    ("s,steps", "Samples per ray (>=1)",
      cxxopts::value<std::size_t>()->default_value(std::to_string(config::kDefaultNumSteps)))

    ("r,refresh", "Occupancy refresh iterations",
      cxxopts::value<std::size_t>()->default_value("16"))
    ("cameras", "Orbit cameras used for visibility marking (0 = skip)",
      cxxopts::value<std::size_t>()->default_value("32"))

    ("staged", "Render in chunks of --batch rays",
      cxxopts::value<bool>()->default_value("false")->implicit_value("true"))
    ("batch", "Rays per chunk when staged (>=1)",
      cxxopts::value<std::size_t>()->default_value(std::to_string(config::kDefaultMaxRayBatch)))
    ("perturb", "Jitter sample depths",
      cxxopts::value<bool>()->default_value("false")->implicit_value("true"))
    ("background", "Background color r,g,b (default white)",
      cxxopts::value<std::string>())

    ("debug", "Enable debug logging",
      cxxopts::value<bool>()->default_value("false")->implicit_value("true"))

    ("h,help", "Print usage");

  auto result = options.parse(argc, argv);
  if (result.count("help")) {
    std::cout << options.help() << std::endl;
    std::exit(0);
  }

  CliOptions opts;
  opts.optionsPath = result["options"].as<std::string>();
  opts.outputPath  = result["output"].as<std::string>();
  opts.loadPath    = result["load"].as<std::string>();

  opts.width     = result["width"].as<std::size_t>();
  opts.height    = result["height"].as<std::size_t>();
  opts.fovDeg    = result["fov"].as<float>();
  opts.numSteps  = std::max<std::size_t>(1, result["steps"].as<std::size_t>());
  opts.refreshes = result["refresh"].as<std::size_t>();
  opts.cameras   = result["cameras"].as<std::size_t>();

  opts.staged      = result["staged"].as<bool>();
  opts.maxRayBatch = std::max<std::size_t>(1, result["batch"].as<std::size_t>());
  opts.perturb     = result["perturb"].as<bool>();
  if (result.count("background"))
    opts.background = util::csv_to_vec3(result["background"].as<std::string>());

  opts.enableDebug = result["debug"].as<bool>();

  return opts;
}

} // namespace nerfgrid::cli
