#include "GifEncoder.hpp"
#include "utils/Errors.hpp"
#include "utils/ModuleLogger.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <fstream>
#include <iterator>
#include <limits>
#include <numeric>
#include <opencv2/imgproc.hpp>
#include <unordered_map>

namespace cutoutreel {

namespace {

std::shared_ptr<spdlog::logger> &gifLogger() {
  static auto logger = moduleLogger("AnimationLogger", "animation.log");
  return logger;
}

constexpr int MAX_LZW_BITS = 12;
constexpr int MAX_LZW_CODE = (1 << MAX_LZW_BITS) - 1;
constexpr size_t MAX_PALETTE_SAMPLES = 50000;

void putU16(std::vector<std::uint8_t> &out, int value) {
  out.push_back(static_cast<std::uint8_t>(value & 0xFF));
  out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
}

// Packs variable-width codes LSB first into 255-byte sub-blocks
class SubBlockWriter {
public:
  explicit SubBlockWriter(std::vector<std::uint8_t> &out) : out_(out) {
    block_.reserve(255);
  }

  void put(int code, int width) {
    bits_ |= static_cast<std::uint32_t>(code) << bitCount_;
    bitCount_ += width;
    while (bitCount_ >= 8) {
      pushByte(static_cast<std::uint8_t>(bits_ & 0xFF));
      bits_ >>= 8;
      bitCount_ -= 8;
    }
  }

  void finish() {
    if (bitCount_ > 0) {
      pushByte(static_cast<std::uint8_t>(bits_ & 0xFF));
      bits_ = 0;
      bitCount_ = 0;
    }
    flushBlock();
    out_.push_back(0x00);
  }

private:
  void pushByte(std::uint8_t byte) {
    block_.push_back(byte);
    if (block_.size() == 255) {
      flushBlock();
    }
  }

  void flushBlock() {
    if (block_.empty()) {
      return;
    }
    out_.push_back(static_cast<std::uint8_t>(block_.size()));
    out_.insert(out_.end(), block_.begin(), block_.end());
    block_.clear();
  }

  std::vector<std::uint8_t> &out_;
  std::vector<std::uint8_t> block_;
  std::uint32_t bits_{0};
  int bitCount_{0};
};

struct ColorBox {
  std::vector<cv::Vec3b> colors;
  cv::Vec3b lo{255, 255, 255};
  cv::Vec3b hi{0, 0, 0};

  void computeBounds() {
    lo = cv::Vec3b(255, 255, 255);
    hi = cv::Vec3b(0, 0, 0);
    for (const auto &c : colors) {
      for (int k = 0; k < 3; ++k) {
        lo[k] = std::min(lo[k], c[k]);
        hi[k] = std::max(hi[k], c[k]);
      }
    }
  }

  [[nodiscard]] int longestAxis() const {
    int axis = 0;
    for (int k = 1; k < 3; ++k) {
      if (hi[k] - lo[k] > hi[axis] - lo[axis]) {
        axis = k;
      }
    }
    return axis;
  }

  [[nodiscard]] bool splittable() const {
    return colors.size() > 1 &&
           (hi[0] > lo[0] || hi[1] > lo[1] || hi[2] > lo[2]);
  }

  [[nodiscard]] cv::Vec3b average() const {
    std::uint64_t sum[3] = {0, 0, 0};
    for (const auto &c : colors) {
      for (int k = 0; k < 3; ++k) {
        sum[k] += c[k];
      }
    }
    const auto n = static_cast<double>(std::max<size_t>(1, colors.size()));
    return cv::Vec3b(cv::saturate_cast<uchar>(std::round(sum[0] / n)),
                     cv::saturate_cast<uchar>(std::round(sum[1] / n)),
                     cv::saturate_cast<uchar>(std::round(sum[2] / n)));
  }
};

// Maps BGR pixels to palette entries, memoizing repeated colors
class PaletteIndexer {
public:
  explicit PaletteIndexer(const std::vector<cv::Vec3b> &palette)
      : palette_(palette) {}

  std::uint8_t operator()(const cv::Vec3b &color) {
    const std::uint32_t key = (static_cast<std::uint32_t>(color[0]) << 16) |
                              (static_cast<std::uint32_t>(color[1]) << 8) |
                              color[2];
    if (auto it = cache_.find(key); it != cache_.end()) {
      return it->second;
    }
    std::uint8_t best = 0;
    int bestDistance = std::numeric_limits<int>::max();
    for (size_t i = 0; i < palette_.size(); ++i) {
      int distance = 0;
      for (int k = 0; k < 3; ++k) {
        const int d = static_cast<int>(color[k]) - palette_[i][k];
        distance += d * d;
      }
      if (distance < bestDistance) {
        bestDistance = distance;
        best = static_cast<std::uint8_t>(i);
      }
    }
    cache_.emplace(key, best);
    return best;
  }

private:
  const std::vector<cv::Vec3b> &palette_;
  std::unordered_map<std::uint32_t, std::uint8_t> cache_;
};

cv::Mat toBgr(const cv::Mat &frame) {
  cv::Mat bgr;
  switch (frame.channels()) {
  case 1:
    cv::cvtColor(frame, bgr, cv::COLOR_GRAY2BGR);
    break;
  case 4:
    cv::cvtColor(frame, bgr, cv::COLOR_BGRA2BGR);
    break;
  default:
    bgr = frame;
  }
  return bgr;
}

void validateFrames(std::span<const cv::Mat> frames,
                    std::span<const int> delaysMs) {
  if (frames.empty()) {
    throw InvalidParameterError("A GIF needs at least one frame");
  }
  if (delaysMs.size() != frames.size()) {
    throw InvalidParameterError(
        fmt::format("Got {} delays for {} frames", delaysMs.size(),
                    frames.size()));
  }
  const cv::Size size = frames[0].size();
  if (size.width <= 0 || size.height <= 0 || size.width > 0xFFFF ||
      size.height > 0xFFFF) {
    throw InvalidParameterError(fmt::format(
        "Frame size {}x{} cannot be stored in a GIF", size.width, size.height));
  }
  for (size_t i = 0; i < frames.size(); ++i) {
    const cv::Mat &f = frames[i];
    if (f.depth() != CV_8U ||
        (f.channels() != 1 && f.channels() != 3 && f.channels() != 4)) {
      throw InvalidParameterError(
          fmt::format("Frame {} is not an 8-bit gray/BGR/BGRA image", i));
    }
    if (f.size() != size) {
      throw InvalidParameterError(fmt::format(
          "Frame {} is {}x{}, expected {}x{}", i, f.cols, f.rows, size.width,
          size.height));
    }
  }
}

int colorTableBits(size_t paletteSize) {
  int bits = 1;
  while ((static_cast<size_t>(1) << bits) < paletteSize && bits < 8) {
    ++bits;
  }
  return bits;
}

} // namespace

int millisecondsToCentiseconds(int milliseconds) noexcept {
  const long cs = std::lround(static_cast<double>(milliseconds) / 10.0);
  return static_cast<int>(std::clamp<long>(cs, GIF_MIN_DELAY_CS, 0xFFFF));
}

std::vector<cv::Vec3b> medianCutPalette(std::span<const cv::Vec3b> samples,
                                        int maxColors) {
  if (samples.empty() || maxColors <= 0) {
    return {};
  }

  ColorBox initial;
  initial.colors.assign(samples.begin(), samples.end());
  initial.computeBounds();

  std::vector<ColorBox> boxes;
  boxes.push_back(std::move(initial));

  while (boxes.size() < static_cast<size_t>(maxColors)) {
    // Split the most populated box that still has a color spread
    size_t best = boxes.size();
    size_t bestSize = 0;
    for (size_t i = 0; i < boxes.size(); ++i) {
      if (boxes[i].splittable() && boxes[i].colors.size() > bestSize) {
        best = i;
        bestSize = boxes[i].colors.size();
      }
    }
    if (best == boxes.size()) {
      break;
    }

    ColorBox &box = boxes[best];
    const int axis = box.longestAxis();
    const size_t mid = box.colors.size() / 2;
    std::nth_element(
        box.colors.begin(), box.colors.begin() + static_cast<ptrdiff_t>(mid),
        box.colors.end(), [axis](const cv::Vec3b &a, const cv::Vec3b &b) {
          return a[axis] < b[axis];
        });

    ColorBox upper;
    upper.colors.assign(box.colors.begin() + static_cast<ptrdiff_t>(mid),
                        box.colors.end());
    box.colors.resize(mid);
    box.computeBounds();
    upper.computeBounds();
    boxes.push_back(std::move(upper));
  }

  std::vector<cv::Vec3b> palette;
  palette.reserve(boxes.size());
  for (const auto &box : boxes) {
    palette.push_back(box.average());
  }
  return palette;
}

LzwTable::LzwTable()
    : children_(static_cast<size_t>(MAX_LZW_CODE + 1) * 256, 0) {
  used_.reserve(MAX_LZW_CODE + 1);
}

std::uint16_t LzwTable::find(int prefix, std::uint8_t next) const {
  return children_[static_cast<size_t>(prefix) * 256 + next];
}

void LzwTable::insert(int prefix, std::uint8_t next, std::uint16_t code) {
  const auto key = static_cast<std::uint32_t>(prefix) * 256 + next;
  children_[key] = code;
  used_.push_back(key);
}

void LzwTable::clear() noexcept {
  for (std::uint32_t key : used_) {
    children_[key] = 0;
  }
  used_.clear();
}

void appendLzwImageData(std::span<const std::uint8_t> indices, int minCodeSize,
                        std::vector<std::uint8_t> &out) {
  LzwTable table;
  appendLzwImageData(indices, minCodeSize, out, table);
}

void appendLzwImageData(std::span<const std::uint8_t> indices, int minCodeSize,
                        std::vector<std::uint8_t> &out, LzwTable &table) {
  minCodeSize = std::clamp(minCodeSize, 2, 8);
  out.push_back(static_cast<std::uint8_t>(minCodeSize));

  const int clearCode = 1 << minCodeSize;
  const int endCode = clearCode + 1;
  int codeSize = minCodeSize + 1;
  int lastCode = endCode; // Highest code assigned so far

  table.clear();
  SubBlockWriter writer(out);
  writer.put(clearCode, codeSize);

  if (indices.empty()) {
    writer.put(endCode, codeSize);
    writer.finish();
    return;
  }

  int current = indices[0];
  for (size_t i = 1; i < indices.size(); ++i) {
    const std::uint8_t next = indices[i];
    if (const std::uint16_t child = table.find(current, next); child != 0) {
      current = child;
      continue;
    }

    writer.put(current, codeSize);
    table.insert(current, next, static_cast<std::uint16_t>(++lastCode));
    // The decoder lags one code behind, so widen after passing the limit
    if (lastCode >= (1 << codeSize)) {
      ++codeSize;
    }
    if (lastCode == MAX_LZW_CODE) {
      writer.put(clearCode, codeSize);
      table.clear();
      codeSize = minCodeSize + 1;
      lastCode = endCode;
    }
    current = next;
  }

  writer.put(current, codeSize);
  // Reading the last code makes the decoder add one more entry
  if (lastCode + 1 >= (1 << codeSize) && codeSize < MAX_LZW_BITS) {
    ++codeSize;
  }
  writer.put(endCode, codeSize);
  writer.finish();
}

GifEncoder::GifEncoder(GifOptions options) : options_(options) {
  if (!options_.isValid()) {
    throw InvalidParameterError(
        fmt::format("Invalid GIF options (loop_count={}, max_colors={})",
                    options_.loopCount, options_.maxColors));
  }
}

std::vector<std::uint8_t>
GifEncoder::encode(std::span<const cv::Mat> frames,
                   std::span<const int> delaysMs) const {
  validateFrames(frames, delaysMs);

  const int width = frames[0].cols;
  const int height = frames[0].rows;
  const bool grayOnly =
      std::all_of(frames.begin(), frames.end(),
                  [](const cv::Mat &f) { return f.channels() == 1; });

  // Global palette and per-frame index planes
  std::vector<cv::Vec3b> palette;
  std::vector<std::vector<std::uint8_t>> planes;
  planes.reserve(frames.size());

  if (grayOnly) {
    palette.reserve(256);
    for (int level = 0; level < 256; ++level) {
      const auto v = static_cast<uchar>(level);
      palette.emplace_back(v, v, v);
    }
    for (const auto &frame : frames) {
      std::vector<std::uint8_t> plane;
      plane.reserve(frame.total());
      for (int r = 0; r < frame.rows; ++r) {
        const uchar *row = frame.ptr<uchar>(r);
        plane.insert(plane.end(), row, row + frame.cols);
      }
      planes.push_back(std::move(plane));
    }
  } else {
    std::vector<cv::Mat> bgrFrames;
    bgrFrames.reserve(frames.size());
    size_t totalPixels = 0;
    for (const auto &frame : frames) {
      bgrFrames.push_back(toBgr(frame));
      totalPixels += frame.total();
    }

    const size_t stride = std::max<size_t>(1, totalPixels / MAX_PALETTE_SAMPLES);
    std::vector<cv::Vec3b> samples;
    samples.reserve(std::min(totalPixels, MAX_PALETTE_SAMPLES + 1));
    size_t position = 0;
    for (const auto &bgr : bgrFrames) {
      for (int r = 0; r < bgr.rows; ++r) {
        const auto *row = bgr.ptr<cv::Vec3b>(r);
        for (int c = 0; c < bgr.cols; ++c, ++position) {
          if (position % stride == 0) {
            samples.push_back(row[c]);
          }
        }
      }
    }
    palette = medianCutPalette(samples, options_.maxColors);

    PaletteIndexer indexOf(palette);
    for (const auto &bgr : bgrFrames) {
      std::vector<std::uint8_t> plane;
      plane.reserve(bgr.total());
      for (int r = 0; r < bgr.rows; ++r) {
        const auto *row = bgr.ptr<cv::Vec3b>(r);
        for (int c = 0; c < bgr.cols; ++c) {
          plane.push_back(indexOf(row[c]));
        }
      }
      planes.push_back(std::move(plane));
    }
  }

  const int tableBits = colorTableBits(palette.size());
  const size_t tableSize = static_cast<size_t>(1) << tableBits;

  std::vector<std::uint8_t> out;
  out.reserve(static_cast<size_t>(width) * height * frames.size() / 2 + 1024);

  // Header and logical screen descriptor
  const char signature[] = "GIF89a";
  out.insert(out.end(), signature, signature + 6);
  putU16(out, width);
  putU16(out, height);
  out.push_back(static_cast<std::uint8_t>(0x80 | ((8 - 1) << 4) |
                                          (tableBits - 1)));
  out.push_back(0x00); // Background color index
  out.push_back(0x00); // Pixel aspect ratio

  // Global color table, stored RGB
  for (size_t i = 0; i < tableSize; ++i) {
    const cv::Vec3b bgr = i < palette.size() ? palette[i] : cv::Vec3b(0, 0, 0);
    out.push_back(bgr[2]);
    out.push_back(bgr[1]);
    out.push_back(bgr[0]);
  }

  // NETSCAPE2.0 looping extension
  const std::uint8_t netscape[] = {0x21, 0xFF, 0x0B, 'N', 'E', 'T', 'S', 'C',
                                   'A',  'P',  'E',  '2', '.', '0', 0x03, 0x01};
  out.insert(out.end(), std::begin(netscape), std::end(netscape));
  putU16(out, options_.loopCount);
  out.push_back(0x00);

  const int minCodeSize = std::max(2, tableBits);
  LzwTable lzwTable;
  for (size_t i = 0; i < planes.size(); ++i) {
    // Graphic control extension
    out.push_back(0x21);
    out.push_back(0xF9);
    out.push_back(0x04);
    out.push_back(0x04); // Disposal: do not dispose, full frames overwrite
    putU16(out, millisecondsToCentiseconds(delaysMs[i]));
    out.push_back(0x00); // No transparent index
    out.push_back(0x00);

    // Image descriptor covering the whole screen, no local color table
    out.push_back(0x2C);
    putU16(out, 0);
    putU16(out, 0);
    putU16(out, width);
    putU16(out, height);
    out.push_back(0x00);

    appendLzwImageData(planes[i], minCodeSize, out, lzwTable);
  }

  out.push_back(0x3B);

  gifLogger()->debug("Encoded {} frames of {}x{} ({} palette entries, {} "
                     "bytes)",
                     planes.size(), width, height, palette.size(), out.size());
  return out;
}

std::size_t GifEncoder::write(const std::filesystem::path &path,
                              std::span<const cv::Mat> frames,
                              std::span<const int> delaysMs) const {
  const std::vector<std::uint8_t> bytes = encode(frames, delaysMs);

  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) {
    gifLogger()->error("Cannot open {} for writing", path.string());
    throw AnimationWriteError("Cannot open animation file " + path.string());
  }
  file.write(reinterpret_cast<const char *>(bytes.data()),
             static_cast<std::streamsize>(bytes.size()));
  file.close();
  if (!file) {
    gifLogger()->error("Failed while writing {}", path.string());
    throw AnimationWriteError("Failed to write animation file " +
                              path.string());
  }
  return bytes.size();
}

std::string_view errorToString(GifError error) noexcept {
  switch (error) {
  case GifError::FileNotFound:
    return "File not found";
  case GifError::ReadError:
    return "Read error";
  case GifError::InvalidSignature:
    return "Not a GIF stream";
  case GifError::Truncated:
    return "Truncated GIF stream";
  default:
    return "Unknown error";
  }
}

std::expected<GifInfo, GifError> inspectGif(std::span<const std::uint8_t> bytes) {
  size_t pos = 0;
  auto available = [&](size_t n) { return pos + n <= bytes.size(); };
  auto u16 = [&](size_t at) {
    return static_cast<int>(bytes[at]) | (static_cast<int>(bytes[at + 1]) << 8);
  };
  // Skips a chain of sub-blocks up to and including the terminator
  auto skipSubBlocks = [&]() -> bool {
    while (available(1)) {
      const size_t length = bytes[pos++];
      if (length == 0) {
        return true;
      }
      if (!available(length)) {
        return false;
      }
      pos += length;
    }
    return false;
  };

  if (!available(13)) {
    return std::unexpected(GifError::Truncated);
  }
  const std::string_view signature(reinterpret_cast<const char *>(bytes.data()),
                                   6);
  if (signature != "GIF89a" && signature != "GIF87a") {
    return std::unexpected(GifError::InvalidSignature);
  }

  GifInfo info;
  info.width = u16(6);
  info.height = u16(8);
  const std::uint8_t screenFlags = bytes[10];
  pos = 13;
  if (screenFlags & 0x80) {
    const size_t tableBytes = 3 * (static_cast<size_t>(1)
                                   << ((screenFlags & 0x07) + 1));
    if (!available(tableBytes)) {
      return std::unexpected(GifError::Truncated);
    }
    pos += tableBytes;
  }

  int pendingDelay = 0;
  while (available(1)) {
    const std::uint8_t introducer = bytes[pos++];
    if (introducer == 0x3B) {
      return info;
    }

    if (introducer == 0x21) {
      if (!available(1)) {
        return std::unexpected(GifError::Truncated);
      }
      const std::uint8_t label = bytes[pos++];
      if (label == 0xF9) {
        if (!available(6)) {
          return std::unexpected(GifError::Truncated);
        }
        pendingDelay = u16(pos + 2);
        pos += 1 + bytes[pos];
      } else if (label == 0xFF) {
        if (!available(12)) {
          return std::unexpected(GifError::Truncated);
        }
        const size_t headerLength = bytes[pos];
        const std::string_view appId(
            reinterpret_cast<const char *>(bytes.data() + pos + 1),
            std::min<size_t>(headerLength, 11));
        pos += 1 + headerLength;
        if (appId == "NETSCAPE2.0" && available(4) && bytes[pos] == 3 &&
            bytes[pos + 1] == 1) {
          info.loopCount = u16(pos + 2);
        }
      }
      if (!skipSubBlocks()) {
        return std::unexpected(GifError::Truncated);
      }
      continue;
    }

    if (introducer == 0x2C) {
      if (!available(9)) {
        return std::unexpected(GifError::Truncated);
      }
      const std::uint8_t imageFlags = bytes[pos + 8];
      pos += 9;
      if (imageFlags & 0x80) {
        const size_t tableBytes =
            3 * (static_cast<size_t>(1) << ((imageFlags & 0x07) + 1));
        if (!available(tableBytes)) {
          return std::unexpected(GifError::Truncated);
        }
        pos += tableBytes;
      }
      if (!available(1)) {
        return std::unexpected(GifError::Truncated);
      }
      ++pos; // LZW minimum code size
      if (!skipSubBlocks()) {
        return std::unexpected(GifError::Truncated);
      }
      ++info.frameCount;
      info.delaysCs.push_back(pendingDelay);
      pendingDelay = 0;
      continue;
    }

    return std::unexpected(GifError::InvalidSignature);
  }
  return std::unexpected(GifError::Truncated);
}

std::expected<GifInfo, GifError>
inspectGif(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec) || ec) {
    return std::unexpected(GifError::FileNotFound);
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return std::unexpected(GifError::ReadError);
  }
  const std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)),
                                        std::istreambuf_iterator<char>());
  return inspectGif(std::span<const std::uint8_t>(bytes));
}

} // namespace cutoutreel
