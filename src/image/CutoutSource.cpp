#include "CutoutSource.hpp"
#include "utils/ModuleLogger.hpp"

#include <algorithm>
#include <cctype>
#include <fitsio.h>
#include <fmt/format.h>
#include <limits>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace cutoutreel {

namespace {

std::shared_ptr<spdlog::logger> &sourceLogger() {
  static auto logger = moduleLogger("SourceLogger", "source.log");
  return logger;
}

// RAII wrapper closing a cfitsio handle
class FitsFileGuard {
  fitsfile *fptr_ = nullptr;
  int status_ = 0;

public:
  explicit FitsFileGuard(fitsfile *fptr = nullptr) noexcept : fptr_(fptr) {}

  ~FitsFileGuard() noexcept {
    if (fptr_) {
      int closeStatus = 0;
      fits_close_file(fptr_, &closeStatus);
      if (closeStatus != 0) {
        char message[FLEN_ERRMSG];
        fits_get_errstatus(closeStatus, message);
        sourceLogger()->error("FITS cleanup error: {}", message);
      }
    }
  }

  FitsFileGuard(const FitsFileGuard &) = delete;
  FitsFileGuard &operator=(const FitsFileGuard &) = delete;

  [[nodiscard]] fitsfile *get() const noexcept { return fptr_; }
  [[nodiscard]] int &status() noexcept { return status_; }

  void reset(fitsfile *fptr) noexcept { fptr_ = fptr; }

  [[nodiscard]] std::string errorMessage() const {
    if (status_ == 0)
      return "";
    char message[FLEN_ERRMSG];
    fits_get_errstatus(status_, message);
    return std::string(message);
  }
};

std::unexpected<AcquisitionError> failure(AcquisitionErrorCode code,
                                          std::string message) {
  return std::unexpected(AcquisitionError{code, std::move(message)});
}

std::optional<std::unexpected<AcquisitionError>>
checkExists(const CutoutRequest &request) {
  std::error_code ec;
  if (!fs::exists(request.path, ec) || ec) {
    sourceLogger()->error("[{}] File does not exist: {}", request.id,
                          request.path.string());
    return failure(AcquisitionErrorCode::FileNotFound,
                   "File does not exist: " + request.path.string());
  }
  return std::nullopt;
}

// Moves to the first HDU holding a 2-D image; returns its dimensions
std::expected<std::pair<long, long>, AcquisitionError>
findImageHdu(FitsFileGuard &guard, const std::string &filename) {
  int &status = guard.status();
  int hduCount = 0;
  if (fits_get_num_hdus(guard.get(), &hduCount, &status)) {
    return failure(AcquisitionErrorCode::ReadError,
                   fmt::format("{}: {}", filename, guard.errorMessage()));
  }

  for (int hdu = 1; hdu <= hduCount; ++hdu) {
    int hduType = 0;
    if (fits_movabs_hdu(guard.get(), hdu, &hduType, &status)) {
      return failure(AcquisitionErrorCode::ReadError,
                     fmt::format("{}: {}", filename, guard.errorMessage()));
    }
    if (hduType != IMAGE_HDU) {
      continue;
    }

    int bitpix = 0;
    int naxis = 0;
    long naxes[2] = {0, 0};
    if (fits_get_img_param(guard.get(), 2, &bitpix, &naxis, naxes, &status)) {
      return failure(AcquisitionErrorCode::ReadError,
                     fmt::format("{}: {}", filename, guard.errorMessage()));
    }
    if (naxis == 2 && naxes[0] > 0 && naxes[1] > 0) {
      sourceLogger()->debug("{}: using HDU {} ({}x{}, BITPIX={})", filename,
                            hdu, naxes[0], naxes[1], bitpix);
      return std::make_pair(naxes[0], naxes[1]);
    }
  }

  return failure(AcquisitionErrorCode::InvalidFormat,
                 filename + " contains no 2-D image");
}

std::expected<cv::Mat, AcquisitionError> readFitsImage(const fs::path &path) {
  const std::string filename = path.string();
  FitsFileGuard guard;
  int &status = guard.status();
  fitsfile *fptr = nullptr;

  if (fits_open_file(&fptr, filename.c_str(), READONLY, &status)) {
    const std::string message = guard.errorMessage();
    sourceLogger()->error("Cannot open FITS file {}: {}", filename, message);
    return failure(AcquisitionErrorCode::ReadError,
                   fmt::format("Cannot open {}: {}", filename, message));
  }
  guard.reset(fptr);

  auto dims = findImageHdu(guard, filename);
  if (!dims) {
    sourceLogger()->error("{}", dims.error().message);
    return std::unexpected(dims.error());
  }
  const auto [width, height] = *dims;
  if (width > std::numeric_limits<int>::max() ||
      height > std::numeric_limits<int>::max()) {
    return failure(AcquisitionErrorCode::InvalidFormat,
                   fmt::format("{}: image too large ({}x{})", filename, width,
                               height));
  }

  // FITS row 1 is the bottom row; it lands in cv::Mat row 0
  cv::Mat grid(static_cast<int>(height), static_cast<int>(width), CV_32F);
  long firstPixel[2] = {1, 1};
  float blank = std::numeric_limits<float>::quiet_NaN();
  int anyBlank = 0;
  if (fits_read_pix(guard.get(), TFLOAT, firstPixel, width * height, &blank,
                    grid.ptr<float>(), &anyBlank, &status)) {
    const std::string message = guard.errorMessage();
    sourceLogger()->error("Failed to read pixels of {}: {}", filename,
                          message);
    return failure(AcquisitionErrorCode::ReadError,
                   fmt::format("Cannot read pixels of {}: {}", filename,
                               message));
  }
  if (anyBlank) {
    sourceLogger()->debug("{}: blank pixels replaced with NaN", filename);
  }
  return grid;
}

} // namespace

std::string_view errorToString(AcquisitionErrorCode code) noexcept {
  switch (code) {
  case AcquisitionErrorCode::FileNotFound:
    return "File not found";
  case AcquisitionErrorCode::ReadError:
    return "Read error";
  case AcquisitionErrorCode::InvalidFormat:
    return "Invalid format";
  case AcquisitionErrorCode::OutOfBounds:
    return "Cutout out of bounds";
  default:
    return "Unknown error";
  }
}

bool isFitsFile(const fs::path &path) noexcept {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext == ".fits" || ext == ".fit" || ext == ".fts";
}

std::expected<cv::Mat, AcquisitionError>
extractWindow(const cv::Mat &image, std::optional<cv::Point> center,
              int size) {
  if (image.empty()) {
    return failure(AcquisitionErrorCode::InvalidFormat, "Empty image");
  }
  if (size < 0) {
    return failure(AcquisitionErrorCode::OutOfBounds,
                   fmt::format("Negative cutout size {}", size));
  }
  if (size == 0) {
    return image.clone();
  }

  const cv::Point c = center.value_or(cv::Point(image.cols / 2, image.rows / 2));
  const cv::Rect window(c.x - size / 2, c.y - size / 2, size, size);
  const cv::Rect overlap = window & cv::Rect(0, 0, image.cols, image.rows);
  if (overlap.empty()) {
    return failure(AcquisitionErrorCode::OutOfBounds,
                   fmt::format("Window at ({}, {}) of size {} misses the "
                               "{}x{} image",
                               c.x, c.y, size, image.cols, image.rows));
  }

  cv::Mat cutout(size, size, image.type(),
                 cv::Scalar::all(std::numeric_limits<double>::quiet_NaN()));
  image(overlap).copyTo(cutout(overlap - window.tl()));
  return cutout;
}

std::expected<cv::Mat, AcquisitionError>
FitsCutoutSource::fetch(const CutoutRequest &request) {
  if (auto missing = checkExists(request)) {
    return *missing;
  }

  auto image = readFitsImage(request.path);
  if (!image) {
    return std::unexpected(image.error());
  }

  auto cutout = extractWindow(*image, request.center, request.size);
  if (cutout) {
    sourceLogger()->info("[{}] Cut {}x{} from {}", request.id, cutout->cols,
                         cutout->rows, request.path.string());
  } else {
    sourceLogger()->warn("[{}] {}", request.id, cutout.error().message);
  }
  return cutout;
}

std::expected<cv::Mat, AcquisitionError>
ImageFileCutoutSource::fetch(const CutoutRequest &request) {
  if (auto missing = checkExists(request)) {
    return *missing;
  }

  cv::Mat raw;
  try {
    raw = cv::imread(request.path.string(), cv::IMREAD_ANYDEPTH |
                                                cv::IMREAD_GRAYSCALE);
  } catch (const cv::Exception &e) {
    sourceLogger()->error("[{}] OpenCV error reading {}: {}", request.id,
                          request.path.string(), e.what());
    return failure(AcquisitionErrorCode::ReadError, e.what());
  }
  if (raw.empty()) {
    sourceLogger()->error("[{}] Cannot decode {}", request.id,
                          request.path.string());
    return failure(AcquisitionErrorCode::InvalidFormat,
                   "Cannot decode " + request.path.string());
  }

  cv::Mat grid;
  raw.convertTo(grid, CV_32F);
  auto cutout = extractWindow(grid, request.center, request.size);
  if (cutout) {
    sourceLogger()->info("[{}] Cut {}x{} from {}", request.id, cutout->cols,
                         cutout->rows, request.path.string());
  } else {
    sourceLogger()->warn("[{}] {}", request.id, cutout.error().message);
  }
  return cutout;
}

std::expected<cv::Mat, AcquisitionError>
FileCutoutSource::fetch(const CutoutRequest &request) {
  if (isFitsFile(request.path)) {
    return fits_.fetch(request);
  }
  return images_.fetch(request);
}

std::unique_ptr<CutoutSource> makeCutoutSource(const fs::path &path) {
  if (isFitsFile(path)) {
    return std::make_unique<FitsCutoutSource>();
  }
  return std::make_unique<ImageFileCutoutSource>();
}

} // namespace cutoutreel
