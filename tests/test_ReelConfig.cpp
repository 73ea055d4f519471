#include "pipeline/ReelConfig.hpp"
#include "utils/Errors.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>

using namespace cutoutreel;
using json = nlohmann::json;
namespace fs = std::filesystem;

TEST(ReelConfigTest, EmptyObjectGivesDefaults) {
  const ReelConfig config = parseConfig(json::object());
  EXPECT_DOUBLE_EQ(config.stats.sigma, 3.0);
  EXPECT_EQ(config.stats.maxIterations, 5);
  EXPECT_TRUE(config.normalize.matchBackground);
  EXPECT_FALSE(config.normalize.matchNoise);
  EXPECT_TRUE(config.sharedRange);
  EXPECT_DOUBLE_EQ(config.normalize.lowerPercentile, 1.0);
  EXPECT_DOUBLE_EQ(config.normalize.upperPercentile, 99.0);
  EXPECT_EQ(config.render.colormap, "gray");
  EXPECT_EQ(config.animation.frameDurationMs, 500);
  EXPECT_EQ(config.animation.output.string(), "out/cutouts.gif");
  EXPECT_TRUE(config.animation.framesDir.empty());
  EXPECT_EQ(config.logging.level, "info");
  EXPECT_TRUE(config.cutouts.empty());
}

TEST(ReelConfigTest, ParsesEverySection) {
  const json j = json::parse(R"({
    "stats": {"sigma": 2.5, "max_iterations": 8},
    "normalize": {"match_background": false, "match_noise": true,
                  "shared_range": false, "lower_percentile": 0.5,
                  "upper_percentile": 99.5},
    "render": {"colormap": "inferno", "flip_vertical": false, "scale": 3,
               "nan_value": 128, "draw_titles": false},
    "animation": {"frame_duration_ms": 250, "output": "reel.gif",
                  "frames_dir": "frames", "grid_output": "grid.png",
                  "grid_columns": 4},
    "logging": {"level": "debug", "directory": "mylogs"},
    "cutouts": [
      {"id": "a", "path": "a.fits", "x": 10, "y": 20, "size": 32,
       "title": "Epoch A"},
      {"path": "data/b.fits"}
    ]
  })");

  const ReelConfig config = parseConfig(j);
  EXPECT_DOUBLE_EQ(config.stats.sigma, 2.5);
  EXPECT_EQ(config.normalize.clip.maxIterations, 8);
  EXPECT_FALSE(config.normalize.matchBackground);
  EXPECT_TRUE(config.normalize.matchNoise);
  EXPECT_FALSE(config.sharedRange);
  EXPECT_EQ(config.render.colormap, "inferno");
  EXPECT_EQ(config.render.scale, 3);
  EXPECT_EQ(config.render.nanValue, 128);
  EXPECT_FALSE(config.render.drawTitle);
  EXPECT_EQ(config.animation.frameDurationMs, 250);
  EXPECT_EQ(config.animation.gridOutput.string(), "grid.png");
  EXPECT_EQ(config.animation.gridColumns, 4);
  EXPECT_EQ(config.logging.directory, "mylogs");

  ASSERT_EQ(config.cutouts.size(), 2u);
  EXPECT_EQ(config.cutouts[0].id, "a");
  ASSERT_TRUE(config.cutouts[0].center.has_value());
  EXPECT_EQ(config.cutouts[0].center->x, 10);
  EXPECT_EQ(config.cutouts[0].center->y, 20);
  EXPECT_EQ(config.cutouts[0].size, 32);
  EXPECT_EQ(config.cutouts[0].title, "Epoch A");
  EXPECT_EQ(config.cutouts[1].id, "b");
  EXPECT_FALSE(config.cutouts[1].center.has_value());
  EXPECT_EQ(config.cutouts[1].size, 0);
}

TEST(ReelConfigTest, SerializedConfigParsesBackUnchanged) {
  ReelConfig config;
  config.stats.sigma = 4.0;
  config.render.colormap = "gray_r";
  config.animation.frameDurationMs = 120;
  CutoutRequest request;
  request.id = "target";
  request.path = "t.fits";
  request.center = cv::Point(3, 4);
  request.size = 16;
  config.cutouts.push_back(request);

  const json j = toJson(config);
  EXPECT_EQ(j["stats"]["sigma"], 4.0);
  EXPECT_EQ(j["cutouts"][0]["x"], 3);

  const ReelConfig back = parseConfig(j);
  EXPECT_EQ(toJson(back), j);
}

TEST(ReelConfigTest, RejectsInvalidValues) {
  const std::vector<std::string> invalid = {
      R"({"stats": {"sigma": 0}})",
      R"({"stats": {"sigma": -1.5}})",
      R"({"normalize": {"lower_percentile": 80, "upper_percentile": 20}})",
      R"({"normalize": {"upper_percentile": 101}})",
      R"({"render": {"colormap": "sparkles"}})",
      R"({"render": {"scale": 0}})",
      R"({"render": {"nan_value": 300}})",
      R"({"animation": {"frame_duration_ms": 0}})",
      R"({"animation": {"grid_columns": 0}})",
      R"({"logging": {"level": "loud"}})",
      R"({"cutouts": [{"id": "no-path"}]})",
      R"({"cutouts": [{"path": "a.fits", "x": 1}]})",
      R"({"cutouts": [{"path": "a.fits", "size": -4}]})",
  };
  for (const auto &text : invalid) {
    EXPECT_THROW((void)parseConfig(json::parse(text)), ConfigError) << text;
  }
}

TEST(ReelConfigTest, RejectsWrongTypes) {
  const std::vector<std::string> invalid = {
      R"([1, 2, 3])",
      R"({"stats": 3})",
      R"({"stats": {"sigma": "three"}})",
      R"({"normalize": {"match_background": "yes"}})",
      R"({"animation": {"output": 42}})",
      R"({"cutouts": {"path": "a.fits"}})",
  };
  for (const auto &text : invalid) {
    EXPECT_THROW((void)parseConfig(json::parse(text)), ConfigError) << text;
  }
}

TEST(ReelConfigTest, LoadsFromFile) {
  const fs::path path = fs::temp_directory_path() / "cutoutreel_config.json";
  {
    std::ofstream file(path);
    file << R"({"animation": {"frame_duration_ms": 750}})";
  }
  const ReelConfig config = loadConfig(path);
  EXPECT_EQ(config.animation.frameDurationMs, 750);
  fs::remove(path);

  EXPECT_THROW((void)loadConfig(fs::temp_directory_path() / "no_such.json"),
               ConfigError);

  const fs::path broken = fs::temp_directory_path() / "cutoutreel_broken.json";
  {
    std::ofstream file(broken);
    file << "{ not json";
  }
  EXPECT_THROW((void)loadConfig(broken), ConfigError);
  fs::remove(broken);
}
