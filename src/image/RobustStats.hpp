#ifndef CUTOUTREEL_ROBUST_STATS_HPP
#define CUTOUTREEL_ROBUST_STATS_HPP

#include <cstddef>
#include <opencv2/core.hpp>
#include <span>
#include <vector>

namespace cutoutreel {

// Scale factor turning a MAD into a Gaussian-equivalent standard deviation
inline constexpr double MAD_TO_SIGMA = 1.4826;

struct SigmaClipConfig {
  double sigma{3.0};     // Clip threshold in multiples of the robust rms
  int maxIterations{5};  // Upper bound on clipping passes
};

struct RobustStats {
  double background{0.0};
  double noise{1.0}; // Always finite and > 0

  auto operator<=>(const RobustStats &) const = default;
};

// Working-set sizes observed while clipping
struct ClipTrace {
  std::vector<std::size_t> sizes; // sizes[0] = finite samples before clipping
  std::size_t finalSize{0};
  int iterations{0}; // Clipping passes that removed at least one sample
};

/**
 * @brief Sigma-clipped median/MAD background and noise of one pixel grid.
 *
 * Non-finite samples are ignored. A grid without finite samples yields
 * {0, 1}. Never throws on degenerate data; the returned noise is always a
 * finite positive number.
 *
 * @param grid Single-channel image of any depth.
 * @param config Clip threshold and iteration limit.
 * @param trace Optional out-parameter receiving the working-set sizes.
 */
[[nodiscard]] RobustStats estimateRobustStats(const cv::Mat &grid,
                                              const SigmaClipConfig &config = {},
                                              ClipTrace *trace = nullptr);

// Same estimator over an already flattened sample set
[[nodiscard]] RobustStats estimateRobustStats(std::span<const double> samples,
                                              const SigmaClipConfig &config = {},
                                              ClipTrace *trace = nullptr);

// Flattens a single-channel grid into its finite samples, row-major order
[[nodiscard]] std::vector<double> finiteSamples(const cv::Mat &grid);

// Median with numpy semantics (mean of the two middle values for even sizes).
// Returns NaN for an empty set.
[[nodiscard]] double median(std::vector<double> values);

[[nodiscard]] double medianAbsoluteDeviation(std::span<const double> values,
                                             double center);

// Population standard deviation; NaN for an empty set
[[nodiscard]] double standardDeviation(std::span<const double> values);

/**
 * @brief Percentile with linear interpolation between closest ranks.
 *
 * Matches numpy.percentile's default method. `percent` is clamped to
 * [0, 100]; NaN for an empty set.
 */
[[nodiscard]] double percentile(std::vector<double> values, double percent);

} // namespace cutoutreel

#endif // CUTOUTREEL_ROBUST_STATS_HPP
