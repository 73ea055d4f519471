#pragma once

#include <opencv2/core.hpp>
#include <string>

namespace cutoutreel {

// A painted picture ready for animation; duration is assigned on assembly
struct RenderedFrame {
  cv::Mat picture; // CV_8UC1 (gray), CV_8UC3 (BGR) or CV_8UC4 (BGRA)
  std::string label;

  [[nodiscard]] bool empty() const noexcept { return picture.empty(); }
};

} // namespace cutoutreel
