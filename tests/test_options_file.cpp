#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

#include "render/volume_renderer.hpp"
#include "util/options_file.hpp"

using namespace nerfgrid;
using render::RendererOptions;

namespace {

class OptionsFileTest : public ::testing::Test {
protected:
    void SetUp() override { path_ = ::testing::TempDir() + "nerfgrid_options_test.txt"; }
    void TearDown() override { std::remove(path_.c_str()); }

    void Write(const std::string& text) {
        std::ofstream out(path_, std::ios::trunc);
        out << text;
    }

    std::string path_;
};

}  // namespace

TEST_F(OptionsFileTest, SaveThenLoad) {
    RendererOptions saved;
    saved.bound = 2.5f;
    saved.gridSize = 64;
    saved.densityScale = 3.f;
    saved.minNear = 0.05f;
    saved.densityThreshold = 0.2f;
    saved.accelerated = true;
    saved.seed = 42;
    util::SaveOptionsToFile(saved, path_);

    RendererOptions loaded;
    ASSERT_TRUE(util::LoadOptionsFromFile(loaded, path_));
    EXPECT_FLOAT_EQ(loaded.bound, 2.5f);
    EXPECT_EQ(loaded.gridSize, 64u);
    EXPECT_FLOAT_EQ(loaded.densityScale, 3.f);
    EXPECT_FLOAT_EQ(loaded.minNear, 0.05f);
    EXPECT_FLOAT_EQ(loaded.densityThreshold, 0.2f);
    EXPECT_TRUE(loaded.accelerated);
    EXPECT_EQ(loaded.seed, 42u);
}

TEST_F(OptionsFileTest, CommentsBlanksAndUnknownKeysIgnored) {
    Write("# scene\n\n  bound = 3 \nunknown=7\nnot a pair\ngridSize=32\n");

    RendererOptions o;
    ASSERT_TRUE(util::LoadOptionsFromFile(o, path_));
    EXPECT_FLOAT_EQ(o.bound, 3.f);
    EXPECT_EQ(o.gridSize, 32u);
    EXPECT_FLOAT_EQ(o.densityScale, config::kDefaultDensityScale);
}

TEST_F(OptionsFileTest, MalformedValueThrows) {
    Write("gridSize=big\n");
    RendererOptions o;
    EXPECT_THROW(util::LoadOptionsFromFile(o, path_), std::invalid_argument);

    Write("bound=1.5x\n");
    EXPECT_THROW(util::LoadOptionsFromFile(o, path_), std::invalid_argument);

    Write("gridSize=-8\n");
    EXPECT_THROW(util::LoadOptionsFromFile(o, path_), std::invalid_argument);

    Write("accelerated=maybe\n");
    EXPECT_THROW(util::LoadOptionsFromFile(o, path_), std::invalid_argument);
}

TEST_F(OptionsFileTest, MissingFileReturnsFalse) {
    RendererOptions o;
    EXPECT_FALSE(util::LoadOptionsFromFile(o, path_ + ".missing"));
    EXPECT_FLOAT_EQ(o.bound, 1.f);
}

TEST(Vec3CsvTest, ParsesTriples) {
    const glm::vec3 v = util::csv_to_vec3("0.5,0.25,1");
    EXPECT_FLOAT_EQ(v.x, 0.5f);
    EXPECT_FLOAT_EQ(v.y, 0.25f);
    EXPECT_FLOAT_EQ(v.z, 1.f);
    EXPECT_EQ(util::vec3_to_csv(glm::vec3(1.f, 2.f, 3.f)), "1,2,3");
}
