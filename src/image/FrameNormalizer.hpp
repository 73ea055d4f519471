#ifndef CUTOUTREEL_FRAME_NORMALIZER_HPP
#define CUTOUTREEL_FRAME_NORMALIZER_HPP

#include "RobustStats.hpp"

#include <optional>
#include <opencv2/core.hpp>
#include <span>
#include <vector>

namespace cutoutreel {

// Guard used when dividing by a per-frame noise estimate
inline constexpr double NOISE_EPSILON = 1e-12;
// Minimum separation enforced between display bounds
inline constexpr double RANGE_EPSILON = 1e-12;

struct NormalizeConfig {
  bool matchBackground{true};   // Subtract the clipped background per frame
  bool matchNoise{false};       // Divide by the clipped rms per frame
  double lowerPercentile{1.0};  // Shared display minimum
  double upperPercentile{99.0}; // Shared display maximum
  SigmaClipConfig clip;

  [[nodiscard]] bool isValid() const noexcept {
    return lowerPercentile >= 0.0 && upperPercentile <= 100.0 &&
           lowerPercentile <= upperPercentile;
  }
};

struct DisplayRange {
  double min{0.0};
  double max{1.0};
};

struct NormalizedBatch {
  std::vector<cv::Mat> frames; // CV_32F, same order as the input
  double displayMin{0.0};
  double displayMax{1.0};
  // Per-frame estimates; empty when no correction was requested
  std::vector<std::optional<RobustStats>> frameStats;

  [[nodiscard]] DisplayRange range() const noexcept {
    return {displayMin, displayMax};
  }
};

/**
 * @brief Corrects each frame and computes one display range for the batch.
 *
 * Frames are copied to CV_32F, never modified in place. The shared range is
 * taken from the pooled finite samples of the corrected frames.
 *
 * @throws EmptyInputError if @p grids is empty.
 * @throws InvalidParameterError for multi-channel frames or bad percentiles.
 */
[[nodiscard]] NormalizedBatch normalizeFrames(std::span<const cv::Mat> grids,
                                              const NormalizeConfig &config = {});

// Convenience overload mirroring the two correction switches
[[nodiscard]] NormalizedBatch normalizeFrames(std::span<const cv::Mat> grids,
                                              bool matchBackground,
                                              bool matchNoise);

// Applies the background/noise correction to a single frame
[[nodiscard]] cv::Mat correctFrame(const cv::Mat &grid,
                                   const NormalizeConfig &config,
                                   std::optional<RobustStats> *statsOut = nullptr);

/**
 * @brief Percentile range over the finite samples of all frames.
 *
 * Falls back to [0, 1] when no finite sample exists and always returns
 * max > min.
 */
[[nodiscard]] DisplayRange sharedDisplayRange(std::span<const cv::Mat> frames,
                                              double lowerPercentile = 1.0,
                                              double upperPercentile = 99.0);

// Pushes max above min when the bounds collapse
[[nodiscard]] DisplayRange enforceStrictRange(DisplayRange range) noexcept;

} // namespace cutoutreel

#endif // CUTOUTREEL_FRAME_NORMALIZER_HPP
