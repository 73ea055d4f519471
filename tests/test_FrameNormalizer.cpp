#include "image/FrameNormalizer.hpp"
#include "utils/Errors.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>

using namespace cutoutreel;

namespace {

constexpr float NaNf = std::numeric_limits<float>::quiet_NaN();

cv::Mat ramp(int rows, int cols, double offset) {
  cv::Mat grid(rows, cols, CV_64F);
  for (int r = 0; r < rows; ++r) {
    for (int c = 0; c < cols; ++c) {
      grid.at<double>(r, c) = offset + r * cols + c;
    }
  }
  return grid;
}

} // namespace

TEST(FrameNormalizerTest, EmptyInputThrows) {
  const std::vector<cv::Mat> none;
  EXPECT_THROW((void)normalizeFrames(none), EmptyInputError);
  EXPECT_THROW((void)normalizeFrames(none, false, false), EmptyInputError);
}

TEST(FrameNormalizerTest, PreservesFrameCountAndOrder) {
  std::vector<cv::Mat> grids;
  for (int i = 0; i < 5; ++i) {
    grids.push_back(cv::Mat(4, 4, CV_32F, cv::Scalar(10.0 * i)));
  }

  const NormalizedBatch batch = normalizeFrames(grids, false, false);
  ASSERT_EQ(batch.frames.size(), grids.size());
  for (size_t i = 0; i < grids.size(); ++i) {
    EXPECT_FLOAT_EQ(batch.frames[i].at<float>(0, 0), 10.0f * i);
  }
}

TEST(FrameNormalizerTest, PassThroughIsNumericallyIdentical) {
  std::vector<cv::Mat> grids = {ramp(6, 7, -3.5), ramp(6, 7, 1000.25)};
  grids[1].at<double>(2, 2) = std::numeric_limits<double>::quiet_NaN();

  const NormalizedBatch batch = normalizeFrames(grids, false, false);
  ASSERT_EQ(batch.frames.size(), 2u);
  for (size_t i = 0; i < grids.size(); ++i) {
    EXPECT_EQ(batch.frames[i].type(), CV_32F);
    for (int r = 0; r < grids[i].rows; ++r) {
      for (int c = 0; c < grids[i].cols; ++c) {
        const double expected = grids[i].at<double>(r, c);
        const float actual = batch.frames[i].at<float>(r, c);
        if (std::isnan(expected)) {
          EXPECT_TRUE(std::isnan(actual));
        } else {
          EXPECT_NEAR(actual, expected, 1e-4);
        }
      }
    }
    EXPECT_FALSE(batch.frameStats[i].has_value());
  }
}

TEST(FrameNormalizerTest, InputIsNotModified) {
  std::vector<cv::Mat> grids = {ramp(5, 5, 20.0)};
  const cv::Mat original = grids[0].clone();

  (void)normalizeFrames(grids, true, true);
  EXPECT_EQ(cv::norm(grids[0], original, cv::NORM_INF), 0.0);
}

TEST(FrameNormalizerTest, ConstantFramesCollapseToZeroWithStrictRange) {
  std::vector<cv::Mat> grids(3);
  for (auto &grid : grids) {
    grid = cv::Mat(5, 5, CV_64F, cv::Scalar(50.0));
  }

  const NormalizedBatch batch = normalizeFrames(grids, true, false);
  ASSERT_EQ(batch.frames.size(), 3u);
  for (const auto &frame : batch.frames) {
    double lo = 0.0;
    double hi = 0.0;
    cv::minMaxLoc(frame, &lo, &hi);
    EXPECT_NEAR(lo, 0.0, 1e-9);
    EXPECT_NEAR(hi, 0.0, 1e-9);
  }
  EXPECT_NEAR(batch.displayMin, 0.0, 1e-9);
  EXPECT_NEAR(batch.displayMax, 0.0, 1e-9);
  EXPECT_GT(batch.displayMax, batch.displayMin);
}

TEST(FrameNormalizerTest, AllNonFiniteBatchUsesUnitRange) {
  std::vector<cv::Mat> grids = {cv::Mat(3, 3, CV_32F, cv::Scalar(NaNf)),
                                cv::Mat(2, 4, CV_32F, cv::Scalar(NaNf))};
  const NormalizedBatch batch = normalizeFrames(grids, true, true);
  EXPECT_DOUBLE_EQ(batch.displayMin, 0.0);
  EXPECT_DOUBLE_EQ(batch.displayMax, 1.0);
  ASSERT_EQ(batch.frameStats.size(), 2u);
  EXPECT_EQ(*batch.frameStats[0], (RobustStats{0.0, 1.0}));
}

TEST(FrameNormalizerTest, SharedRangeUsesPooledPercentiles) {
  // Pooled samples 0..199 split over two frames
  std::vector<cv::Mat> grids = {ramp(10, 10, 0.0), ramp(10, 10, 100.0)};
  const NormalizedBatch batch = normalizeFrames(grids, false, false);
  EXPECT_NEAR(batch.displayMin, 1.99, 1e-9);
  EXPECT_NEAR(batch.displayMax, 197.01, 1e-9);
}

TEST(FrameNormalizerTest, MatchNoiseDividesByClippedRms) {
  cv::Mat grid(1, 3, CV_64F);
  grid.at<double>(0, 0) = 1.0;
  grid.at<double>(0, 1) = 2.0;
  grid.at<double>(0, 2) = 3.0;
  std::vector<cv::Mat> grids = {grid};

  const NormalizedBatch batch = normalizeFrames(grids, true, true);
  ASSERT_TRUE(batch.frameStats[0].has_value());
  EXPECT_DOUBLE_EQ(batch.frameStats[0]->background, 2.0);
  EXPECT_NEAR(batch.frames[0].at<float>(0, 0), -1.0 / MAD_TO_SIGMA, 1e-6);
  EXPECT_NEAR(batch.frames[0].at<float>(0, 1), 0.0, 1e-6);
  EXPECT_NEAR(batch.frames[0].at<float>(0, 2), 1.0 / MAD_TO_SIGMA, 1e-6);
}

TEST(FrameNormalizerTest, RejectsMultiChannelFrames) {
  std::vector<cv::Mat> grids = {cv::Mat(2, 2, CV_32FC3, cv::Scalar::all(1))};
  EXPECT_THROW((void)normalizeFrames(grids), InvalidParameterError);
}

TEST(FrameNormalizerTest, RejectsInvalidPercentiles) {
  std::vector<cv::Mat> grids = {ramp(3, 3, 0.0)};
  NormalizeConfig config;
  config.lowerPercentile = 90.0;
  config.upperPercentile = 10.0;
  EXPECT_THROW((void)normalizeFrames(grids, config), InvalidParameterError);
}

TEST(FrameNormalizerTest, StrictRangeNudgesCollapsedBounds) {
  const DisplayRange small = enforceStrictRange({0.0, 0.0});
  EXPECT_DOUBLE_EQ(small.max, RANGE_EPSILON);

  const DisplayRange large = enforceStrictRange({1e20, 1e20});
  EXPECT_GT(large.max, large.min);

  const DisplayRange untouched = enforceStrictRange({-2.0, 3.0});
  EXPECT_DOUBLE_EQ(untouched.min, -2.0);
  EXPECT_DOUBLE_EQ(untouched.max, 3.0);
}

TEST(FrameNormalizerTest, LargeBackgroundKeepsPrecisionAfterScaling) {
  cv::Mat grid(32, 32, CV_32F);
  cv::RNG rng(11);
  rng.fill(grid, cv::RNG::NORMAL, 1.0e6, 3.0);

  const std::vector<cv::Mat> grids = {grid};
  const NormalizedBatch batch = normalizeFrames(grids, true, true);
  ASSERT_TRUE(batch.frameStats[0].has_value());
  const RobustStats stats = *batch.frameStats[0];

  const cv::Mat &out = batch.frames[0];
  ASSERT_EQ(out.type(), CV_32F);
  for (int r = 0; r < grid.rows; ++r) {
    for (int c = 0; c < grid.cols; ++c) {
      const double expected =
          (static_cast<double>(grid.at<float>(r, c)) - stats.background) /
          stats.noise;
      EXPECT_NEAR(out.at<float>(r, c), expected, 1e-5);
    }
  }
}

TEST(FrameNormalizerTest, EmptyGridInBatchGetsNeutralStats) {
  const std::vector<cv::Mat> grids = {ramp(4, 4, 10.0), cv::Mat()};
  const NormalizedBatch batch = normalizeFrames(grids, true, true);

  ASSERT_EQ(batch.frames.size(), 2u);
  EXPECT_TRUE(batch.frames[1].empty());
  ASSERT_TRUE(batch.frameStats[1].has_value());
  EXPECT_EQ(*batch.frameStats[1], (RobustStats{0.0, 1.0}));
  EXPECT_GT(batch.displayMax, batch.displayMin);
}
