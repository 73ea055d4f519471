#include "image/CutoutGrid.hpp"
#include "utils/Errors.hpp"

#include <gtest/gtest.h>
#include <limits>
#include <vector>

using namespace cutoutreel;

namespace {

std::vector<cv::Mat> sampleCutouts(int count) {
  std::vector<cv::Mat> grids;
  for (int i = 0; i < count; ++i) {
    cv::Mat grid(8, 8, CV_32F);
    cv::randu(grid, cv::Scalar(0.0), cv::Scalar(100.0 + i));
    grids.push_back(grid);
  }
  return grids;
}

} // namespace

TEST(CutoutGridTest, EmptyInputThrows) {
  const std::vector<cv::Mat> none;
  EXPECT_THROW((void)renderCutoutGrid(none), EmptyInputError);
}

TEST(CutoutGridTest, InvalidQuantilesThrow) {
  const auto grids = sampleCutouts(2);
  GridOptions options;
  options.qmin = -0.1;
  EXPECT_THROW((void)renderCutoutGrid(grids, options), InvalidParameterError);

  options.qmin = 0.5;
  options.qmax = 0.2;
  EXPECT_THROW((void)renderCutoutGrid(grids, options), InvalidParameterError);

  options.qmin = 0.0;
  options.qmax = 1.5;
  EXPECT_THROW((void)renderCutoutGrid(grids, options), InvalidParameterError);
}

TEST(CutoutGridTest, InvalidLayoutThrows) {
  const auto grids = sampleCutouts(3);
  GridOptions options;
  options.columns = 0;
  EXPECT_THROW((void)renderCutoutGrid(grids, options), InvalidParameterError);

  options.columns = 2;
  options.titles = {"a", "b"};
  EXPECT_THROW((void)renderCutoutGrid(grids, options), InvalidParameterError);
}

TEST(CutoutGridTest, CanvasFollowsRowsAndColumns) {
  const auto grids = sampleCutouts(7);
  GridOptions options;
  options.columns = 3;
  options.cellSize = 40;
  options.spacing = 4;

  const cv::Mat canvas = renderCutoutGrid(grids, options);
  EXPECT_EQ(canvas.type(), CV_8UC3);
  EXPECT_EQ(canvas.cols, 3 * 40 + 4 * 4);
  EXPECT_EQ(canvas.rows, 3 * 40 + 4 * 4);

  // The last row only holds one cutout; its remaining cells stay blank
  const cv::Vec3b blank = canvas.at<cv::Vec3b>(canvas.rows - 10,
                                               canvas.cols - 10);
  EXPECT_EQ(blank, cv::Vec3b(255, 255, 255));
}

TEST(CutoutGridTest, FewerCutoutsThanColumnsShrinksTheCanvas) {
  const auto grids = sampleCutouts(2);
  GridOptions options;
  options.cellSize = 30;
  options.spacing = 2;
  const cv::Mat canvas = renderCutoutGrid(grids, options);
  EXPECT_EQ(canvas.cols, 2 * 30 + 3 * 2);
  EXPECT_EQ(canvas.rows, 30 + 2 * 2);
}

TEST(CutoutGridTest, TitlesAddRowHeight) {
  const auto grids = sampleCutouts(2);
  GridOptions options;
  options.cellSize = 30;
  options.spacing = 2;
  const int plainRows = renderCutoutGrid(grids, options).rows;

  options.titles = {"first", "second"};
  const int titledRows = renderCutoutGrid(grids, options).rows;
  EXPECT_GT(titledRows, plainRows);
}

TEST(CutoutGridTest, AllNaNCutoutStillRenders) {
  std::vector<cv::Mat> grids = {
      cv::Mat(6, 6, CV_32F,
              cv::Scalar(std::numeric_limits<float>::quiet_NaN())),
      cv::Mat(6, 6, CV_32F, cv::Scalar(1.0))};
  const cv::Mat canvas = renderCutoutGrid(grids);
  EXPECT_FALSE(canvas.empty());
}
