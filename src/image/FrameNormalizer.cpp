#include "FrameNormalizer.hpp"
#include "utils/Errors.hpp"
#include "utils/ModuleLogger.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <limits>

namespace cutoutreel {

namespace {

std::shared_ptr<spdlog::logger> &normalizerLogger() {
  static auto logger = moduleLogger("NormalizerLogger", "normalizer.log");
  return logger;
}

void validateFrames(std::span<const cv::Mat> grids) {
  if (grids.empty()) {
    normalizerLogger()->error("No frames given to the normalizer");
    throw EmptyInputError("Cannot normalize an empty frame sequence");
  }
  for (size_t i = 0; i < grids.size(); ++i) {
    if (!grids[i].empty() && grids[i].channels() != 1) {
      normalizerLogger()->error("Frame {} has {} channels", i,
                                grids[i].channels());
      throw InvalidParameterError(
          fmt::format("Frame {} is not a single-channel grid", i));
    }
  }
}

} // namespace

DisplayRange enforceStrictRange(DisplayRange range) noexcept {
  if (range.max <= range.min) {
    range.max = range.min + RANGE_EPSILON;
    // The epsilon vanishes next to large magnitudes
    if (range.max <= range.min) {
      range.max = std::nextafter(range.min,
                                 std::numeric_limits<double>::infinity());
    }
  }
  return range;
}

cv::Mat correctFrame(const cv::Mat &grid, const NormalizeConfig &config,
                     std::optional<RobustStats> *statsOut) {
  cv::Mat working;
  if (grid.empty()) {
    working = cv::Mat(grid.rows, grid.cols, CV_32F);
  } else {
    grid.convertTo(working, CV_32F);
  }

  std::optional<RobustStats> stats;
  if (config.matchBackground || config.matchNoise) {
    // An empty grid has no finite samples and gets the neutral {0, 1}
    stats = estimateRobustStats(grid, config.clip);
  }

  if (stats && !working.empty()) {
    const double offset = config.matchBackground ? stats->background : 0.0;
    const double scale =
        config.matchNoise ? 1.0 / std::max(stats->noise, NOISE_EPSILON) : 1.0;
    // Subtract first, then scale, both in double; NaN propagates untouched
    cv::Mat wide;
    grid.convertTo(wide, CV_64F);
    cv::subtract(wide, cv::Scalar(offset), wide);
    cv::multiply(wide, cv::Scalar(scale), wide);
    wide.convertTo(working, CV_32F);
  }

  if (statsOut) {
    *statsOut = stats;
  }
  return working;
}

DisplayRange sharedDisplayRange(std::span<const cv::Mat> frames,
                                double lowerPercentile,
                                double upperPercentile) {
  std::vector<double> pooled;
  size_t total = 0;
  for (const auto &frame : frames) {
    total += frame.total();
  }
  pooled.reserve(total);
  for (const auto &frame : frames) {
    auto samples = finiteSamples(frame);
    pooled.insert(pooled.end(), samples.begin(), samples.end());
  }

  if (pooled.empty()) {
    normalizerLogger()->warn(
        "Batch holds no finite samples, using default range [0, 1]");
    return DisplayRange{0.0, 1.0};
  }

  DisplayRange range{percentile(pooled, lowerPercentile),
                     percentile(pooled, upperPercentile)};
  if (range.max <= range.min) {
    normalizerLogger()->debug("Degenerate display range at {:.6g}, nudging",
                              range.min);
  }
  return enforceStrictRange(range);
}

NormalizedBatch normalizeFrames(std::span<const cv::Mat> grids,
                                const NormalizeConfig &config) {
  validateFrames(grids);
  if (!config.isValid()) {
    normalizerLogger()->error("Invalid percentiles [{}, {}]",
                              config.lowerPercentile, config.upperPercentile);
    throw InvalidParameterError(
        fmt::format("Percentiles must satisfy 0 <= lower <= upper <= 100, "
                    "got [{}, {}]",
                    config.lowerPercentile, config.upperPercentile));
  }

  normalizerLogger()->info(
      "Normalizing {} frames (match_background={}, match_noise={})",
      grids.size(), config.matchBackground, config.matchNoise);

  NormalizedBatch batch;
  batch.frames.reserve(grids.size());
  batch.frameStats.reserve(grids.size());

  for (size_t i = 0; i < grids.size(); ++i) {
    std::optional<RobustStats> stats;
    batch.frames.push_back(correctFrame(grids[i], config, &stats));
    if (stats) {
      normalizerLogger()->debug("Frame {}: background={:.6g} noise={:.6g}", i,
                                stats->background, stats->noise);
    }
    batch.frameStats.push_back(stats);
  }

  const DisplayRange range = sharedDisplayRange(
      batch.frames, config.lowerPercentile, config.upperPercentile);
  batch.displayMin = range.min;
  batch.displayMax = range.max;

  normalizerLogger()->info("Shared display range: [{:.6g}, {:.6g}]",
                           batch.displayMin, batch.displayMax);
  return batch;
}

NormalizedBatch normalizeFrames(std::span<const cv::Mat> grids,
                                bool matchBackground, bool matchNoise) {
  NormalizeConfig config;
  config.matchBackground = matchBackground;
  config.matchNoise = matchNoise;
  return normalizeFrames(grids, config);
}

} // namespace cutoutreel
