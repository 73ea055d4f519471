#ifndef CUTOUTREEL_ERRORS_HPP
#define CUTOUTREEL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace cutoutreel {

// Base class for every error raised by the library
class CutoutReelError : public std::runtime_error {
public:
  explicit CutoutReelError(const std::string &message)
      : std::runtime_error(message) {}
};

// A batch or montage was requested with no frames at all
class EmptyInputError : public CutoutReelError {
public:
  explicit EmptyInputError(const std::string &message)
      : CutoutReelError(message) {}
};

// The animation assembler received no pictures
class EmptySequenceError : public CutoutReelError {
public:
  explicit EmptySequenceError(const std::string &message)
      : CutoutReelError(message) {}
};

class InvalidParameterError : public CutoutReelError {
public:
  explicit InvalidParameterError(const std::string &message)
      : CutoutReelError(message) {}
};

class AnimationWriteError : public CutoutReelError {
public:
  explicit AnimationWriteError(const std::string &message)
      : CutoutReelError(message) {}
};

class ConfigError : public CutoutReelError {
public:
  explicit ConfigError(const std::string &message)
      : CutoutReelError(message) {}
};

} // namespace cutoutreel

#endif // CUTOUTREEL_ERRORS_HPP
