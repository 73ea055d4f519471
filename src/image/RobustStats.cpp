#include "RobustStats.hpp"
#include "utils/ModuleLogger.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>

namespace cutoutreel {

namespace {

std::shared_ptr<spdlog::logger> &statsLogger() {
  static auto logger = moduleLogger("RobustStatsLogger", "robust_stats.log");
  return logger;
}

inline bool usableScale(double value) noexcept {
  return std::isfinite(value) && value > 0.0;
}

template <typename T>
void appendFinite(const cv::Mat &grid, std::vector<double> &out) {
  for (int r = 0; r < grid.rows; ++r) {
    const T *row = grid.ptr<T>(r);
    for (int c = 0; c < grid.cols; ++c) {
      const auto value = static_cast<double>(row[c]);
      if (std::isfinite(value)) {
        out.push_back(value);
      }
    }
  }
}

} // namespace

std::vector<double> finiteSamples(const cv::Mat &grid) {
  std::vector<double> samples;
  if (grid.empty()) {
    return samples;
  }
  CV_Assert(grid.channels() == 1);
  samples.reserve(grid.total());

  switch (grid.depth()) {
  case CV_8U:
    appendFinite<uchar>(grid, samples);
    break;
  case CV_8S:
    appendFinite<schar>(grid, samples);
    break;
  case CV_16U:
    appendFinite<ushort>(grid, samples);
    break;
  case CV_16S:
    appendFinite<short>(grid, samples);
    break;
  case CV_32S:
    appendFinite<int>(grid, samples);
    break;
  case CV_32F:
    appendFinite<float>(grid, samples);
    break;
  case CV_64F:
    appendFinite<double>(grid, samples);
    break;
  default: {
    cv::Mat converted;
    grid.convertTo(converted, CV_64F);
    appendFinite<double>(converted, samples);
  }
  }
  return samples;
}

double median(std::vector<double> values) {
  if (values.empty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  const std::size_t mid = values.size() / 2;
  std::nth_element(values.begin(), values.begin() + mid, values.end());
  double med = values[mid];
  if ((values.size() & 1U) == 0U) {
    // Lower middle is the largest element left of the partition point
    const double lower = *std::max_element(values.begin(), values.begin() + mid);
    med = 0.5 * (med + lower);
  }
  return med;
}

double medianAbsoluteDeviation(std::span<const double> values, double center) {
  std::vector<double> deviations;
  deviations.reserve(values.size());
  for (double v : values) {
    deviations.push_back(std::abs(v - center));
  }
  return median(std::move(deviations));
}

double standardDeviation(std::span<const double> values) {
  if (values.empty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  const double n = static_cast<double>(values.size());
  const double mean = std::accumulate(values.begin(), values.end(), 0.0) / n;
  double sumSq = 0.0;
  for (double v : values) {
    sumSq += (v - mean) * (v - mean);
  }
  return std::sqrt(sumSq / n);
}

double percentile(std::vector<double> values, double percent) {
  if (values.empty()) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  percent = std::clamp(percent, 0.0, 100.0);

  const double rank = percent / 100.0 * static_cast<double>(values.size() - 1);
  const auto lowerIndex = static_cast<std::size_t>(std::floor(rank));
  const double fraction = rank - static_cast<double>(lowerIndex);

  std::nth_element(values.begin(), values.begin() + lowerIndex, values.end());
  const double lower = values[lowerIndex];
  if (fraction <= 0.0 || lowerIndex + 1 >= values.size()) {
    return lower;
  }
  const double upper =
      *std::min_element(values.begin() + lowerIndex + 1, values.end());
  return lower + fraction * (upper - lower);
}

RobustStats estimateRobustStats(std::span<const double> samples,
                                const SigmaClipConfig &config,
                                ClipTrace *trace) {
  std::vector<double> working;
  working.reserve(samples.size());
  for (double v : samples) {
    if (std::isfinite(v)) {
      working.push_back(v);
    }
  }

  if (trace) {
    *trace = ClipTrace{};
    trace->sizes.push_back(working.size());
  }

  if (working.empty()) {
    statsLogger()->debug("No finite samples, using neutral defaults");
    return RobustStats{0.0, 1.0};
  }

  std::vector<double> kept;
  for (int iter = 0; iter < config.maxIterations; ++iter) {
    const double med = median(working);
    const double rms = MAD_TO_SIGMA * medianAbsoluteDeviation(working, med);
    // A zero MAD means more than half the samples share one value
    if (!usableScale(rms)) {
      break;
    }

    const double limit = config.sigma * rms;
    kept.clear();
    for (double v : working) {
      if (std::abs(v - med) <= limit) {
        kept.push_back(v);
      }
    }
    if (kept.size() == working.size() || kept.empty()) {
      break;
    }

    working.swap(kept);
    if (trace) {
      trace->sizes.push_back(working.size());
      ++trace->iterations;
    }
  }

  RobustStats stats;
  stats.background = median(working);
  stats.noise =
      MAD_TO_SIGMA * medianAbsoluteDeviation(working, stats.background);
  if (!usableScale(stats.noise)) {
    stats.noise = standardDeviation(working);
  }
  if (!usableScale(stats.noise)) {
    stats.noise = 1.0;
  }

  if (trace) {
    trace->finalSize = working.size();
  }
  statsLogger()->debug("Clipped stats: background={:.6g} noise={:.6g} "
                       "kept {}/{} samples",
                       stats.background, stats.noise, working.size(),
                       samples.size());
  return stats;
}

RobustStats estimateRobustStats(const cv::Mat &grid,
                                const SigmaClipConfig &config,
                                ClipTrace *trace) {
  const std::vector<double> samples = finiteSamples(grid);
  return estimateRobustStats(std::span<const double>(samples), config, trace);
}

} // namespace cutoutreel
