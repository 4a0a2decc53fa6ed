#pragma once

#include <highfive/H5File.hpp>
#include <highfive/H5DataType.hpp>

namespace h5 = HighFive;

namespace nerfgrid::io {

// On-disk row of the "spheres" dataset; mirrors field::SoftSphere flattened.
struct SphereRecord {
  float cx, cy, cz;
  float radius;
  float density;
  float r, g, b;
};
static_assert(sizeof(SphereRecord) == 32, "SphereRecord must be 32 bytes");

inline HighFive::CompoundType MakeSphereRecordType() {
  using namespace HighFive;
  return CompoundType{
      {"cx",      create_datatype<float>(), offsetof(SphereRecord, cx)},
      {"cy",      create_datatype<float>(), offsetof(SphereRecord, cy)},
      {"cz",      create_datatype<float>(), offsetof(SphereRecord, cz)},
      {"radius",  create_datatype<float>(), offsetof(SphereRecord, radius)},
      {"density", create_datatype<float>(), offsetof(SphereRecord, density)},
      {"r",       create_datatype<float>(), offsetof(SphereRecord, r)},
      {"g",       create_datatype<float>(), offsetof(SphereRecord, g)},
      {"b",       create_datatype<float>(), offsetof(SphereRecord, b)}};
}

}  // namespace nerfgrid::io

HIGHFIVE_REGISTER_TYPE(nerfgrid::io::SphereRecord, nerfgrid::io::MakeSphereRecordType)
