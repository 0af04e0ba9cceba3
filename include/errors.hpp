#ifndef WAVESYNTH_ERRORS_HPP
#define WAVESYNTH_ERRORS_HPP

#include <stdexcept>
#include <string>

// Note token that does not parse or names an unknown pitch class.
class MalformedNoteError : public std::invalid_argument {
public:
  explicit MalformedNoteError(const std::string &note)
      : std::invalid_argument("Malformed note: '" + note + "'"), note(note) {}

  std::string note;
};

// Duty cycle, duration, frequency, level or configuration value outside its
// valid domain. Raised when a stream is constructed, never during a pull.
class InvalidParameterError : public std::invalid_argument {
public:
  explicit InvalidParameterError(const std::string &what)
      : std::invalid_argument(what) {}
};

// A transform asked a finite source for more samples than it had.
class StreamExhaustedError : public std::runtime_error {
public:
  StreamExhaustedError(long index, long requested)
      : std::runtime_error("Stream exhausted at sample " +
                           std::to_string(index) + " of " +
                           std::to_string(requested) + " requested"),
        index(index), requested(requested) {}

  long index;
  long requested;
};

// Failure while turning a sample into container bytes. index is -1 when the
// failure is not tied to a sample (opening or finalizing the container).
class RenderError : public std::runtime_error {
public:
  RenderError(const std::string &what, long index = -1, double value = 0.0)
      : std::runtime_error(what), index(index), value(value) {}

  long index;
  double value;
};

class QuantizationError : public RenderError {
public:
  QuantizationError(long index, double value)
      : RenderError("Sample " + std::to_string(index) + " with value " +
                        std::to_string(value) +
                        " is not representable as 16-bit PCM",
                    index, value) {}
};

class EncodingError : public RenderError {
public:
  EncodingError(const std::string &what, long index = -1, double value = 0.0)
      : RenderError(what, index, value) {}
};

#endif
