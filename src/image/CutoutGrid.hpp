#pragma once

#include <opencv2/core.hpp>
#include <span>
#include <string>
#include <vector>

namespace cutoutreel {

struct GridOptions {
  int columns{5};
  double qmin{0.0};  // Lower quantile per cell, NaN-aware
  double qmax{0.99}; // Upper quantile per cell, NaN-aware
  std::string colormap{"gray_r"};
  int cellSize{160};  // Side of the square each cutout is scaled into
  int spacing{6};     // Gap between cells
  bool flipVertical{true};
  std::vector<std::string> titles; // Empty or one per cutout
};

/**
 * @brief Lays cutouts out in a grid, each scaled between its own quantiles.
 *
 * Unused cells of the last row stay blank.
 *
 * @throws EmptyInputError if @p grids is empty.
 * @throws InvalidParameterError for bad quantiles, column count or titles.
 */
[[nodiscard]] cv::Mat renderCutoutGrid(std::span<const cv::Mat> grids,
                                       const GridOptions &options = {});

} // namespace cutoutreel
