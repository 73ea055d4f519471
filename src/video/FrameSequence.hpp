#pragma once

#include "GifEncoder.hpp"
#include "RenderedFrame.hpp"

#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace cutoutreel {

// An ordered, uniformly timed, endlessly looping frame sequence
struct Animation {
  std::vector<RenderedFrame> frames;
  int frameDurationMs{500};
  int loopCount{0}; // 0 = infinite

  [[nodiscard]] std::size_t frameCount() const noexcept {
    return frames.size();
  }
};

// What the assembler observed while writing
struct AssemblyReport {
  std::size_t frameCount{0};
  std::filesystem::path outputPath;
  std::size_t bytesWritten{0};
  int resizedFrames{0}; // Frames resampled to the first frame's size
};

/**
 * @brief Validates rendered frames and writes them as a looping GIF.
 *
 * Frames are used strictly in the given order. Parent directories of the
 * output path are created as needed.
 */
class FrameSequenceAssembler {
public:
  explicit FrameSequenceAssembler(GifOptions options = {});

  /**
   * @throws EmptySequenceError if @p frames is empty.
   * @throws InvalidParameterError if @p frameDurationMs is not positive or a
   *         frame is not an 8-bit picture.
   * @throws AnimationWriteError if the file cannot be written.
   */
  Animation assemble(std::span<const RenderedFrame> frames,
                     int frameDurationMs,
                     const std::filesystem::path &outputPath,
                     AssemblyReport *report = nullptr) const;

  /**
   * @brief Assembles every `*.png` in @p pngDirectory, sorted by filename.
   * @throws EmptySequenceError if the directory holds no PNG file.
   */
  Animation assembleDirectory(const std::filesystem::path &pngDirectory,
                              const std::filesystem::path &outputPath,
                              int frameDurationMs,
                              AssemblyReport *report = nullptr) const;

private:
  GifOptions options_;
};

// Free-function form of FrameSequenceAssembler::assemble with default options
Animation assembleAnimation(std::span<const RenderedFrame> frames,
                            int frameDurationMs,
                            const std::filesystem::path &outputPath,
                            AssemblyReport *report = nullptr);

/**
 * @brief Reads back the file named by @p report and checks its frame count.
 * @throws AnimationWriteError if the file cannot be parsed as a GIF or holds
 *         a different number of frames than were assembled.
 */
GifInfo verifyWrittenAnimation(const AssemblyReport &report);

} // namespace cutoutreel
