#ifndef CUTOUTREEL_GIF_ENCODER_HPP
#define CUTOUTREEL_GIF_ENCODER_HPP

#include <cstdint>
#include <expected>
#include <filesystem>
#include <opencv2/core.hpp>
#include <span>
#include <string_view>
#include <vector>

namespace cutoutreel {

// Smallest delay (in centiseconds) that common viewers honor
inline constexpr int GIF_MIN_DELAY_CS = 2;

struct GifOptions {
  int loopCount{0};  // 0 = repeat forever
  int maxColors{256}; // Palette size for color input, 2..256

  [[nodiscard]] bool isValid() const noexcept {
    return loopCount >= 0 && loopCount <= 0xFFFF && maxColors >= 2 &&
           maxColors <= 256;
  }
};

// Converts a display duration to the GIF delay field
[[nodiscard]] int millisecondsToCentiseconds(int milliseconds) noexcept;

/**
 * @brief Animated GIF89a encoder.
 *
 * All frames share one global color table. Pure gray input is stored
 * losslessly with a 256-level gray ramp; color input is quantized with a
 * median-cut palette computed over samples of every frame.
 */
class GifEncoder {
public:
  explicit GifEncoder(GifOptions options = {});

  /**
   * @brief Encodes frames into a complete GIF stream.
   * @param frames 8-bit frames with 1, 3 (BGR) or 4 (BGRA) channels, all of
   *        the same size.
   * @param delaysMs Per-frame display duration, one entry per frame.
   * @throws InvalidParameterError on empty input or inconsistent frames.
   */
  [[nodiscard]] std::vector<std::uint8_t>
  encode(std::span<const cv::Mat> frames, std::span<const int> delaysMs) const;

  // Encodes and writes the stream; returns the number of bytes written
  std::size_t write(const std::filesystem::path &path,
                    std::span<const cv::Mat> frames,
                    std::span<const int> delaysMs) const;

  [[nodiscard]] const GifOptions &options() const noexcept { return options_; }

private:
  GifOptions options_;
};

// LZW string table mapping (prefix code, next index) to a code. Allocated
// once and reused across frames; clear() only touches entries in use.
class LzwTable {
public:
  LzwTable();

  // 0 when the string is not in the table
  [[nodiscard]] std::uint16_t find(int prefix, std::uint8_t next) const;
  void insert(int prefix, std::uint8_t next, std::uint16_t code);
  void clear() noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return used_.size(); }

private:
  std::vector<std::uint16_t> children_;
  std::vector<std::uint32_t> used_;
};

// LZW-compresses palette indices into GIF sub-blocks (including the
// leading minimum code size byte and the block terminator)
void appendLzwImageData(std::span<const std::uint8_t> indices,
                        int minCodeSize, std::vector<std::uint8_t> &out,
                        LzwTable &table);

// Same, with a table of its own
void appendLzwImageData(std::span<const std::uint8_t> indices,
                        int minCodeSize, std::vector<std::uint8_t> &out);

// Median-cut palette (BGR triples) from a set of BGR samples
[[nodiscard]] std::vector<cv::Vec3b>
medianCutPalette(std::span<const cv::Vec3b> samples, int maxColors);

enum class GifError { FileNotFound, ReadError, InvalidSignature, Truncated };

[[nodiscard]] std::string_view errorToString(GifError error) noexcept;

struct GifInfo {
  int width{0};
  int height{0};
  int frameCount{0};
  int loopCount{-1}; // -1 when the stream has no looping extension
  std::vector<int> delaysCs;
};

// Walks the block structure of a GIF file without decoding pixel data
[[nodiscard]] std::expected<GifInfo, GifError>
inspectGif(const std::filesystem::path &path);

[[nodiscard]] std::expected<GifInfo, GifError>
inspectGif(std::span<const std::uint8_t> bytes);

} // namespace cutoutreel

#endif // CUTOUTREEL_GIF_ENCODER_HPP
