#pragma once

#include "FrameNormalizer.hpp"

#include <opencv2/core.hpp>

namespace cutoutreel {

// IRAF zscale parameters
struct ZScaleConfig {
  int nSamples{1000};
  double contrast{0.25};
  double maxReject{0.5};
  int minPixels{5};
  double krej{2.5};
  int maxIterations{5};
};

/**
 * @brief Display range from a line fit to the sorted pixel samples.
 *
 * Samples the finite pixels on a regular stride, fits a line to their sorted
 * values with iterative rejection and narrows the full sample range to the
 * fitted slope scaled by the contrast. No finite sample gives [0, 1]. The
 * result may have min == max for constant data.
 */
[[nodiscard]] DisplayRange zscaleInterval(const cv::Mat &grid,
                                          const ZScaleConfig &config = {});

} // namespace cutoutreel
