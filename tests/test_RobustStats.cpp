#include "image/RobustStats.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <random>
#include <span>
#include <vector>

using namespace cutoutreel;

namespace {

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

cv::Mat gaussianGrid(int size, double mean, double sigma, unsigned seed) {
  std::mt19937 rng(seed);
  std::normal_distribution<double> dist(mean, sigma);
  cv::Mat grid(size, size, CV_64F);
  for (int r = 0; r < size; ++r) {
    for (int c = 0; c < size; ++c) {
      grid.at<double>(r, c) = dist(rng);
    }
  }
  return grid;
}

} // namespace

TEST(RobustStatsTest, ZeroMadStopsClippingBeforeTheOutlier) {
  cv::Mat grid(10, 10, CV_64F, cv::Scalar(100.0));
  grid.at<double>(3, 7) = 10000.0;

  ClipTrace trace;
  const RobustStats stats = estimateRobustStats(grid, {3.0, 5}, &trace);

  // MAD of the set is 0, so no pass runs and the noise is the plain
  // population std-dev: mean 199, variance 970299
  EXPECT_DOUBLE_EQ(stats.background, 100.0);
  EXPECT_NEAR(stats.noise, std::sqrt(970299.0), 1e-9);
  EXPECT_EQ(trace.iterations, 0);
  EXPECT_EQ(trace.finalSize, 100u);
}

TEST(RobustStatsTest, MostlyConstantSkewedGridKeepsUnclippedStdDev) {
  // 60 samples at 100 and a tail 101..140
  std::vector<double> samples(60, 100.0);
  for (int v = 101; v <= 140; ++v) {
    samples.push_back(static_cast<double>(v));
  }
  double mean = 0.0;
  for (double v : samples) {
    mean += v;
  }
  mean /= static_cast<double>(samples.size());
  double variance = 0.0;
  for (double v : samples) {
    variance += (v - mean) * (v - mean);
  }
  variance /= static_cast<double>(samples.size());

  ClipTrace trace;
  const RobustStats stats =
      estimateRobustStats(std::span<const double>(samples), {3.0, 5}, &trace);

  EXPECT_DOUBLE_EQ(stats.background, 100.0);
  EXPECT_NEAR(stats.noise, std::sqrt(variance), 1e-9);
  EXPECT_NEAR(stats.noise, 12.416, 1e-3);
  EXPECT_EQ(trace.iterations, 0);
  EXPECT_EQ(trace.finalSize, samples.size());
}

TEST(RobustStatsTest, OutlierIsClippedFromNoisyBackground) {
  cv::Mat grid = gaussianGrid(32, 100.0, 2.0, 7);
  grid.at<double>(5, 5) = 10000.0;

  ClipTrace trace;
  const RobustStats stats = estimateRobustStats(grid, {3.0, 5}, &trace);

  EXPECT_NEAR(stats.background, 100.0, 0.5);
  EXPECT_NEAR(stats.noise, 2.0, 0.5);
  EXPECT_GE(trace.iterations, 1);
  EXPECT_LT(trace.finalSize, 1024u);
}

TEST(RobustStatsTest, AllNonFiniteGridGivesNeutralDefaults) {
  cv::Mat grid(4, 4, CV_32F, cv::Scalar(NaN));
  grid.at<float>(0, 0) = std::numeric_limits<float>::infinity();

  const RobustStats stats = estimateRobustStats(grid);
  EXPECT_EQ(stats.background, 0.0);
  EXPECT_EQ(stats.noise, 1.0);
}

TEST(RobustStatsTest, EmptyGridGivesNeutralDefaults) {
  const RobustStats stats = estimateRobustStats(cv::Mat());
  EXPECT_EQ(stats, (RobustStats{0.0, 1.0}));
}

TEST(RobustStatsTest, ConstantGridFallsBackToUnitNoise) {
  cv::Mat grid(6, 6, CV_32F, cv::Scalar(42.0));
  const RobustStats stats = estimateRobustStats(grid);
  EXPECT_DOUBLE_EQ(stats.background, 42.0);
  EXPECT_DOUBLE_EQ(stats.noise, 1.0);
}

TEST(RobustStatsTest, NonFiniteSamplesAreIgnored) {
  cv::Mat grid(3, 3, CV_64F, cv::Scalar(NaN));
  grid.at<double>(0, 0) = 1.0;
  grid.at<double>(1, 1) = 2.0;
  grid.at<double>(2, 2) = 3.0;

  ClipTrace trace;
  const RobustStats stats = estimateRobustStats(grid, {}, &trace);
  EXPECT_DOUBLE_EQ(stats.background, 2.0);
  EXPECT_DOUBLE_EQ(stats.noise, MAD_TO_SIGMA * 1.0);
  EXPECT_EQ(trace.sizes.front(), 3u);
}

TEST(RobustStatsTest, GaussianNoiseIsRecovered) {
  const cv::Mat grid = gaussianGrid(100, 500.0, 12.0, 7u);
  const RobustStats stats = estimateRobustStats(grid);
  EXPECT_NEAR(stats.background, 500.0, 1.0);
  EXPECT_NEAR(stats.noise, 12.0, 1.0);
}

TEST(RobustStatsTest, ClippingNeverExpandsTheWorkingSet) {
  cv::Mat grid = gaussianGrid(40, 0.0, 1.0, 11u);
  for (int i = 0; i < 40; i += 3) {
    grid.at<double>(i, i) = 50.0 + i;
  }

  ClipTrace trace;
  (void)estimateRobustStats(grid, {2.0, 10}, &trace);

  ASSERT_GE(trace.sizes.size(), 2u);
  for (size_t i = 1; i < trace.sizes.size(); ++i) {
    EXPECT_LT(trace.sizes[i], trace.sizes[i - 1]);
  }
  EXPECT_EQ(trace.finalSize, trace.sizes.back());
  EXPECT_LE(trace.iterations, 10);
}

TEST(RobustStatsTest, ZeroIterationsSkipsClipping) {
  cv::Mat grid(10, 10, CV_64F, cv::Scalar(100.0));
  grid.at<double>(0, 0) = 10000.0;

  ClipTrace trace;
  const RobustStats stats = estimateRobustStats(grid, {3.0, 0}, &trace);
  EXPECT_EQ(trace.finalSize, 100u);
  EXPECT_EQ(trace.iterations, 0);
  EXPECT_DOUBLE_EQ(stats.background, 100.0);
}

TEST(RobustStatsTest, IntegerGridsAreAccepted) {
  cv::Mat grid(5, 5, CV_16U, cv::Scalar(1000));
  const RobustStats stats = estimateRobustStats(grid);
  EXPECT_DOUBLE_EQ(stats.background, 1000.0);
}

TEST(RobustStatsTest, MedianUsesMeanOfMiddlePairForEvenSizes) {
  EXPECT_DOUBLE_EQ(median({4.0, 1.0, 3.0, 2.0}), 2.5);
  EXPECT_DOUBLE_EQ(median({5.0, 1.0, 3.0}), 3.0);
  EXPECT_TRUE(std::isnan(median({})));
}

TEST(RobustStatsTest, PercentileInterpolatesLinearly) {
  const std::vector<double> values = {1.0, 2.0, 3.0, 4.0, 5.0};
  EXPECT_DOUBLE_EQ(percentile(values, 0.0), 1.0);
  EXPECT_DOUBLE_EQ(percentile(values, 100.0), 5.0);
  EXPECT_DOUBLE_EQ(percentile(values, 50.0), 3.0);
  EXPECT_DOUBLE_EQ(percentile(values, 10.0), 1.4);
  EXPECT_DOUBLE_EQ(percentile(values, 150.0), 5.0);
  EXPECT_TRUE(std::isnan(percentile({}, 50.0)));
}

TEST(RobustStatsTest, StandardDeviationIsPopulationBased) {
  const std::vector<double> values = {2.0, 4.0, 4.0, 4.0, 5.0, 5.0, 7.0, 9.0};
  EXPECT_DOUBLE_EQ(standardDeviation(values), 2.0);
}

TEST(RobustStatsTest, FiniteSamplesRejectsMultiChannelGrids) {
  cv::Mat grid(2, 2, CV_32FC3, cv::Scalar::all(1.0));
  EXPECT_THROW((void)finiteSamples(grid), cv::Exception);
}
