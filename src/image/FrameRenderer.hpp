#ifndef CUTOUTREEL_FRAME_RENDERER_HPP
#define CUTOUTREEL_FRAME_RENDERER_HPP

#include "FrameNormalizer.hpp"
#include "video/RenderedFrame.hpp"

#include <filesystem>
#include <optional>
#include <opencv2/core.hpp>
#include <span>
#include <string>
#include <vector>

namespace cutoutreel {

struct RenderOptions {
  std::string colormap{"gray"}; // gray, gray_r or an OpenCV colormap name
  bool flipVertical{true};      // Row 0 at the bottom
  int scale{1};                 // Nearest-neighbour upscaling factor
  int nanValue{0};              // Gray level painted for non-finite pixels
  bool drawTitle{true};

  [[nodiscard]] bool isValid() const noexcept;
};

[[nodiscard]] bool isKnownColormap(const std::string &name) noexcept;

/**
 * @brief Maps a grid linearly onto 8-bit gray levels.
 *
 * Values at or below range.min become 0, at or above range.max become 255.
 * Non-finite pixels are painted with @p nanValue.
 */
[[nodiscard]] cv::Mat toDisplay8U(const cv::Mat &grid, DisplayRange range,
                                  int nanValue = 0);

// Gray stays single channel, gray_r is inverted, others become BGR
[[nodiscard]] cv::Mat applyNamedColormap(const cv::Mat &gray8,
                                         const std::string &name);

/**
 * @brief Paints one grid into a picture.
 *
 * Without @p range the ZScale interval of the grid is used.
 *
 * @throws InvalidParameterError for multi-channel grids or bad options.
 */
[[nodiscard]] RenderedFrame renderFrame(const cv::Mat &grid,
                                        std::optional<DisplayRange> range,
                                        const RenderOptions &options = {},
                                        const std::string &title = {});

// Renders a batch in order; titles may be empty or match the grid count
[[nodiscard]] std::vector<RenderedFrame>
renderFrames(std::span<const cv::Mat> grids, std::optional<DisplayRange> range,
             const RenderOptions &options = {},
             std::span<const std::string> titles = {});

/**
 * @brief Writes frames as `<prefix>_0000.png`, `<prefix>_0001.png`, ...
 *
 * The zero-padded index keeps filename order equal to sequence order.
 * @return The written paths in sequence order.
 */
std::vector<std::filesystem::path>
writeFramePngs(std::span<const RenderedFrame> frames,
               const std::filesystem::path &directory,
               const std::string &prefix = "frame");

} // namespace cutoutreel

#endif // CUTOUTREEL_FRAME_RENDERER_HPP
