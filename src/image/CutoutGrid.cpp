#include "CutoutGrid.hpp"
#include "FrameRenderer.hpp"
#include "RobustStats.hpp"
#include "utils/Errors.hpp"
#include "utils/ModuleLogger.hpp"

#include <algorithm>
#include <fmt/format.h>
#include <opencv2/imgproc.hpp>

namespace cutoutreel {

namespace {

std::shared_ptr<spdlog::logger> &gridLogger() {
  static auto logger = moduleLogger("RenderLogger", "render.log");
  return logger;
}

void validateOptions(std::span<const cv::Mat> grids,
                     const GridOptions &options) {
  if (grids.empty()) {
    gridLogger()->error("No cutouts given to the grid renderer");
    throw EmptyInputError("No images provided");
  }
  if (!(options.qmin >= 0.0 && options.qmin <= 1.0 && options.qmax >= 0.0 &&
        options.qmax <= 1.0)) {
    throw InvalidParameterError("qmin and qmax must be in [0, 1]");
  }
  if (options.qmax < options.qmin) {
    throw InvalidParameterError("qmax must be >= qmin");
  }
  if (options.columns < 1 || options.cellSize < 1 || options.spacing < 0) {
    throw InvalidParameterError(fmt::format(
        "Invalid grid layout (columns={}, cell_size={}, spacing={})",
        options.columns, options.cellSize, options.spacing));
  }
  if (!options.titles.empty() && options.titles.size() != grids.size()) {
    throw InvalidParameterError(fmt::format(
        "Got {} titles for {} cutouts", options.titles.size(), grids.size()));
  }
  if (!isKnownColormap(options.colormap)) {
    throw InvalidParameterError(
        fmt::format("Unknown colormap '{}'", options.colormap));
  }
}

// Fits a picture into a square cell keeping its aspect ratio
cv::Mat fitIntoCell(const cv::Mat &picture, int cellSize) {
  const double factor = static_cast<double>(cellSize) /
                        std::max(picture.cols, picture.rows);
  const cv::Size size(std::max(1, cvRound(picture.cols * factor)),
                      std::max(1, cvRound(picture.rows * factor)));
  cv::Mat scaled;
  cv::resize(picture, scaled, size, 0, 0, cv::INTER_NEAREST);
  return scaled;
}

} // namespace

cv::Mat renderCutoutGrid(std::span<const cv::Mat> grids,
                         const GridOptions &options) {
  validateOptions(grids, options);

  const int count = static_cast<int>(grids.size());
  const int columns = std::min(options.columns, count);
  const int rows = (count + options.columns - 1) / options.columns;
  const bool withTitles = !options.titles.empty();
  const int titleHeight = withTitles ? 18 : 0;

  const int cellWidth = options.cellSize;
  const int cellHeight = options.cellSize + titleHeight;
  const int width = columns * cellWidth + (columns + 1) * options.spacing;
  const int height = rows * cellHeight + (rows + 1) * options.spacing;
  cv::Mat canvas(height, width, CV_8UC3, cv::Scalar::all(255));

  for (int i = 0; i < count; ++i) {
    const cv::Mat &grid = grids[i];
    const int row = i / options.columns;
    const int col = i % options.columns;
    const int x0 = options.spacing + col * (cellWidth + options.spacing);
    const int y0 = options.spacing + row * (cellHeight + options.spacing);

    if (withTitles) {
      cv::putText(canvas, options.titles[i], cv::Point(x0 + 2, y0 + 13),
                  cv::FONT_HERSHEY_SIMPLEX, 0.4, cv::Scalar::all(0), 1,
                  cv::LINE_AA);
    }
    if (grid.empty()) {
      continue;
    }
    if (grid.channels() != 1) {
      throw InvalidParameterError(
          fmt::format("Cutout {} is not a single-channel grid", i));
    }

    // Per-cell linear quantile normalization
    const std::vector<double> samples = finiteSamples(grid);
    DisplayRange range{0.0, 1.0};
    if (!samples.empty()) {
      range = {percentile(samples, options.qmin * 100.0),
               percentile(samples, options.qmax * 100.0)};
    }

    cv::Mat cell = toDisplay8U(grid, range);
    if (options.flipVertical) {
      cv::flip(cell, cell, 0);
    }
    cell = applyNamedColormap(cell, options.colormap);
    if (cell.channels() == 1) {
      cv::cvtColor(cell, cell, cv::COLOR_GRAY2BGR);
    }
    cell = fitIntoCell(cell, options.cellSize);

    const int dx = (cellWidth - cell.cols) / 2;
    const int dy = titleHeight + (options.cellSize - cell.rows) / 2;
    cell.copyTo(canvas(cv::Rect(x0 + dx, y0 + dy, cell.cols, cell.rows)));
  }

  gridLogger()->info("Rendered {} cutouts into a {}x{} grid ({} columns)",
                     count, width, height, columns);
  return canvas;
}

} // namespace cutoutreel
