#ifndef CUTOUTREEL_CUTOUT_SOURCE_HPP
#define CUTOUTREEL_CUTOUT_SOURCE_HPP

#include <expected>
#include <filesystem>
#include <memory>
#include <opencv2/core.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace cutoutreel {

enum class AcquisitionErrorCode {
  FileNotFound,
  ReadError,
  InvalidFormat,
  OutOfBounds
};

struct AcquisitionError {
  AcquisitionErrorCode code{AcquisitionErrorCode::ReadError};
  std::string message;
};

[[nodiscard]] std::string_view errorToString(AcquisitionErrorCode code) noexcept;

struct CutoutRequest {
  std::string id;
  std::filesystem::path path;
  std::optional<cv::Point> center; // Pixel coordinates; image center if unset
  int size{0};                     // Side length, 0 = whole image
  std::string title;
};

/**
 * @brief Produces one single-channel CV_32F pixel grid per request.
 *
 * Failures are returned, never thrown, so a batch can continue past them.
 */
class CutoutSource {
public:
  virtual ~CutoutSource() = default;

  [[nodiscard]] virtual std::expected<cv::Mat, AcquisitionError>
  fetch(const CutoutRequest &request) = 0;
};

// Reads the first 2-D image HDU of a FITS file. Blank pixels become NaN.
class FitsCutoutSource : public CutoutSource {
public:
  [[nodiscard]] std::expected<cv::Mat, AcquisitionError>
  fetch(const CutoutRequest &request) override;
};

// Reads any image OpenCV can decode and converts it to gray float
class ImageFileCutoutSource : public CutoutSource {
public:
  [[nodiscard]] std::expected<cv::Mat, AcquisitionError>
  fetch(const CutoutRequest &request) override;
};

// Dispatches each request to the FITS or image-file reader by extension
class FileCutoutSource : public CutoutSource {
public:
  [[nodiscard]] std::expected<cv::Mat, AcquisitionError>
  fetch(const CutoutRequest &request) override;

private:
  FitsCutoutSource fits_;
  ImageFileCutoutSource images_;
};

[[nodiscard]] bool isFitsFile(const std::filesystem::path &path) noexcept;

// Picks the reader matching the extension of @p path
[[nodiscard]] std::unique_ptr<CutoutSource>
makeCutoutSource(const std::filesystem::path &path);

/**
 * @brief Cuts a size x size window centered on @p center out of @p image.
 *
 * Pixels outside the image are NaN. A window with no overlap at all yields
 * OutOfBounds; size 0 returns a copy of the whole image.
 */
[[nodiscard]] std::expected<cv::Mat, AcquisitionError>
extractWindow(const cv::Mat &image, std::optional<cv::Point> center, int size);

} // namespace cutoutreel

#endif // CUTOUTREEL_CUTOUT_SOURCE_HPP
