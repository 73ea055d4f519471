#include "FrameRenderer.hpp"
#include "ZScale.hpp"
#include "utils/Errors.hpp"
#include "utils/ModuleLogger.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <fmt/format.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <unordered_map>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace cutoutreel {

namespace {

std::shared_ptr<spdlog::logger> &renderLogger() {
  static auto logger = moduleLogger("RenderLogger", "render.log");
  return logger;
}

const std::unordered_map<std::string, int> &opencvColormaps() {
  static const std::unordered_map<std::string, int> maps = {
      {"viridis", cv::COLORMAP_VIRIDIS}, {"inferno", cv::COLORMAP_INFERNO},
      {"magma", cv::COLORMAP_MAGMA},     {"plasma", cv::COLORMAP_PLASMA},
      {"hot", cv::COLORMAP_HOT},         {"bone", cv::COLORMAP_BONE},
      {"jet", cv::COLORMAP_JET},         {"cividis", cv::COLORMAP_CIVIDIS},
  };
  return maps;
}

constexpr int TITLE_FONT = cv::FONT_HERSHEY_SIMPLEX;
constexpr double TITLE_SCALE = 0.4;
constexpr int TITLE_PADDING = 4;

cv::Mat addTitleStrip(const cv::Mat &image, const std::string &title) {
  int baseline = 0;
  const cv::Size textSize =
      cv::getTextSize(title, TITLE_FONT, TITLE_SCALE, 1, &baseline);
  const int stripHeight = textSize.height + baseline + 2 * TITLE_PADDING;

  cv::Mat canvas(image.rows + stripHeight, image.cols, image.type(),
                 cv::Scalar::all(255));
  image.copyTo(canvas(cv::Rect(0, stripHeight, image.cols, image.rows)));

  const int x = std::max(0, (image.cols - textSize.width) / 2);
  cv::putText(canvas, title, cv::Point(x, TITLE_PADDING + textSize.height),
              TITLE_FONT, TITLE_SCALE, cv::Scalar::all(0), 1, cv::LINE_AA);
  return canvas;
}

} // namespace

bool isKnownColormap(const std::string &name) noexcept {
  return name == "gray" || name == "gray_r" ||
         opencvColormaps().contains(name);
}

bool RenderOptions::isValid() const noexcept {
  return scale >= 1 && nanValue >= 0 && nanValue <= 255 &&
         isKnownColormap(colormap);
}

cv::Mat toDisplay8U(const cv::Mat &grid, DisplayRange range, int nanValue) {
  if (grid.empty()) {
    return cv::Mat();
  }
  if (grid.channels() != 1) {
    throw InvalidParameterError("Only single-channel grids can be rendered");
  }

  range = enforceStrictRange(range);
  cv::Mat values;
  grid.convertTo(values, CV_64F);

  const double span = range.max - range.min;
  const auto fill = static_cast<uchar>(std::clamp(nanValue, 0, 255));
  cv::Mat out(values.size(), CV_8UC1);
  for (int r = 0; r < values.rows; ++r) {
    const double *src = values.ptr<double>(r);
    uchar *dst = out.ptr<uchar>(r);
    for (int c = 0; c < values.cols; ++c) {
      const double v = src[c];
      if (!std::isfinite(v)) {
        dst[c] = fill;
        continue;
      }
      const double t = std::clamp((v - range.min) / span, 0.0, 1.0);
      dst[c] = cv::saturate_cast<uchar>(t * 255.0);
    }
  }
  return out;
}

cv::Mat applyNamedColormap(const cv::Mat &gray8, const std::string &name) {
  if (name == "gray") {
    return gray8;
  }
  if (name == "gray_r") {
    cv::Mat inverted;
    cv::bitwise_not(gray8, inverted);
    return inverted;
  }
  const auto it = opencvColormaps().find(name);
  if (it == opencvColormaps().end()) {
    throw InvalidParameterError(fmt::format("Unknown colormap '{}'", name));
  }
  cv::Mat colored;
  cv::applyColorMap(gray8, colored, it->second);
  return colored;
}

RenderedFrame renderFrame(const cv::Mat &grid,
                          std::optional<DisplayRange> range,
                          const RenderOptions &options,
                          const std::string &title) {
  if (!options.isValid()) {
    renderLogger()->error("Invalid render options (colormap='{}', scale={})",
                          options.colormap, options.scale);
    throw InvalidParameterError("Invalid render options");
  }
  if (grid.empty()) {
    throw InvalidParameterError("Cannot render an empty grid");
  }
  if (grid.channels() != 1) {
    throw InvalidParameterError(
        fmt::format("Cannot render a {}-channel grid", grid.channels()));
  }

  const DisplayRange effective = range ? *range : zscaleInterval(grid);
  cv::Mat picture = toDisplay8U(grid, effective, options.nanValue);

  if (options.flipVertical) {
    cv::flip(picture, picture, 0);
  }
  picture = applyNamedColormap(picture, options.colormap);
  if (options.scale > 1) {
    cv::resize(picture, picture, cv::Size(), options.scale, options.scale,
               cv::INTER_NEAREST);
  }
  if (options.drawTitle && !title.empty()) {
    picture = addTitleStrip(picture, title);
  }

  renderLogger()->debug("Rendered {}x{} frame '{}' with range [{:.6g}, {:.6g}]",
                        picture.cols, picture.rows, title, effective.min,
                        effective.max);
  return RenderedFrame{picture, title};
}

std::vector<RenderedFrame> renderFrames(std::span<const cv::Mat> grids,
                                        std::optional<DisplayRange> range,
                                        const RenderOptions &options,
                                        std::span<const std::string> titles) {
  if (!titles.empty() && titles.size() != grids.size()) {
    throw InvalidParameterError(fmt::format(
        "Got {} titles for {} grids", titles.size(), grids.size()));
  }

  std::vector<RenderedFrame> frames(grids.size());
  std::vector<std::exception_ptr> failures(grids.size());
  const int count = static_cast<int>(grids.size());

#pragma omp parallel for schedule(dynamic)
  for (int i = 0; i < count; ++i) {
    try {
      frames[i] = renderFrame(grids[i], range, options,
                              titles.empty() ? std::string{} : titles[i]);
    } catch (...) {
      failures[i] = std::current_exception();
    }
  }

  for (const auto &failure : failures) {
    if (failure) {
      std::rethrow_exception(failure);
    }
  }
  renderLogger()->info("Rendered {} frames", frames.size());
  return frames;
}

std::vector<std::filesystem::path>
writeFramePngs(std::span<const RenderedFrame> frames,
               const std::filesystem::path &directory,
               const std::string &prefix) {
  std::filesystem::create_directories(directory);

  std::vector<std::filesystem::path> written;
  written.reserve(frames.size());
  for (size_t i = 0; i < frames.size(); ++i) {
    const auto path = directory / fmt::format("{}_{:04d}.png", prefix, i);
    if (!cv::imwrite(path.string(), frames[i].picture)) {
      renderLogger()->error("Failed to write frame {}", path.string());
      throw AnimationWriteError("Cannot write frame " + path.string());
    }
    written.push_back(path);
  }
  renderLogger()->info("Wrote {} PNG frames to {}", written.size(),
                       directory.string());
  return written;
}

} // namespace cutoutreel
