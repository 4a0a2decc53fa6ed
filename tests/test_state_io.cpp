#include <gtest/gtest.h>

#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "field/sphere_field.hpp"
#include "geometry/camera_rays.hpp"
#include "io/state_io.hpp"
#include "render/volume_renderer.hpp"

using namespace nerfgrid;

namespace {

std::vector<field::SoftSphere> Scene() {
    return {{glm::vec3(0.f), 0.5f, 20.f, glm::vec3(1.f, 0.f, 0.f)},
            {glm::vec3(0.3f, 0.f, 0.2f), 0.2f, 5.f, glm::vec3(0.f, 1.f, 0.f)}};
}

render::RendererOptions Options(std::size_t gridSize) {
    render::RendererOptions o;
    o.bound = 2.f;
    o.gridSize = gridSize;
    return o;
}

class StateIoTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = ::testing::TempDir() + "nerfgrid_state_test.h5";
    }
    void TearDown() override { std::remove(path_.c_str()); }

    std::string path_;
};

}  // namespace

TEST_F(StateIoTest, RoundTripRestoresGridAndBoxes) {
    auto field = std::make_shared<const field::SphereField>(Scene());
    render::VolumeRenderer source(field, Options(8));
    const glm::mat4 pose = geometry::lookAtPose(glm::vec3(0.f, 0.f, -4.f), glm::vec3(0.f));
    source.markUntrainedGrid({pose}, geometry::Intrinsics{50.f, 50.f, 10.f, 10.f});
    source.recordSteps(17, 3);
    source.recordSteps(9, 3);
    source.refreshOccupancy();
    source.recordSteps(21, 4);
    source.setAabbTrain(geometry::Aabb{glm::vec3(-1.f, -1.5f, -2.f), glm::vec3(2.f, 1.5f, 1.f)});

    io::saveState(source, path_);

    render::VolumeRenderer target(field, Options(8));
    io::loadState(target, path_);

    EXPECT_EQ(target.grid().densities(), source.grid().densities());
    EXPECT_EQ(target.grid().bitfield(), source.grid().bitfield());
    EXPECT_EQ(target.grid().stepCounter().slots(), source.grid().stepCounter().slots());
    EXPECT_FLOAT_EQ(target.grid().meanDensity(), source.grid().meanDensity());
    EXPECT_EQ(target.aabbTrain().toArray(), source.aabbTrain().toArray());
    EXPECT_EQ(target.aabbInfer().toArray(), source.aabbInfer().toArray());
}

TEST_F(StateIoTest, GridSizeMismatchRejected) {
    auto field = std::make_shared<const field::SphereField>(Scene());
    render::VolumeRenderer source(field, Options(8));
    io::saveState(source, path_);

    render::VolumeRenderer target(field, Options(16));
    EXPECT_THROW(io::loadState(target, path_), std::runtime_error);
}

TEST_F(StateIoTest, SpheresStoredAlongside) {
    auto field = std::make_shared<const field::SphereField>(Scene());
    render::VolumeRenderer renderer(field, Options(4));

    io::saveState(renderer, path_);
    EXPECT_TRUE(io::loadSpheres(path_).empty());

    io::saveState(renderer, path_, Scene());
    const auto spheres = io::loadSpheres(path_);
    ASSERT_EQ(spheres.size(), 2u);
    EXPECT_FLOAT_EQ(spheres[1].center.x, 0.3f);
    EXPECT_FLOAT_EQ(spheres[1].radius, 0.2f);
    EXPECT_FLOAT_EQ(spheres[1].density, 5.f);
    EXPECT_FLOAT_EQ(spheres[1].rgb.g, 1.f);
}

TEST_F(StateIoTest, MissingFileThrows) {
    auto field = std::make_shared<const field::SphereField>(Scene());
    render::VolumeRenderer renderer(field, Options(4));
    EXPECT_THROW(io::loadState(renderer, path_ + ".missing"), std::runtime_error);
    EXPECT_THROW(io::loadSpheres(path_ + ".missing"), std::runtime_error);
}
