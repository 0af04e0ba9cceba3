#ifndef WAVESYNTH_SOUND_HPP
#define WAVESYNTH_SOUND_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "config.hpp"

namespace Sound {

using Sample = double;

// A lazy, single-pass sequence of samples. Pulling advances the stream;
// there is no way back.
class SampleStream {
public:
  virtual ~SampleStream() = default;

  // The next sample, or std::nullopt once a finite stream has ended. An
  // unbounded stream never returns std::nullopt.
  virtual std::optional<Sample> next() = 0;

  // True if the stream is guaranteed to end.
  virtual bool bounded() const = 0;
};

using StreamPtr = std::unique_ptr<SampleStream>;

enum WaveForm { Sine, Triangular, Square, Saw, WhiteNoise };

std::string typeOfWave(WaveForm form);
std::optional<WaveForm> waveFromString(const std::string &str);

// ---- Sources ----

// Constant level forever. Only useful as envelope scaffolding or a gain;
// truncate before rendering.
StreamPtr hold(Sample level);
StreamPtr silence();

// Every oscillator repeats a cycle of round(sampleRate / frequency) samples.
// Rounding the cycle to whole samples makes the pitch drift audibly as the
// frequency approaches the sampling rate.
StreamPtr rectangularWave(const RenderConfig &config, double frequency,
                          double dutyCycle, Sample min = 0.0,
                          Sample max = 1.0);
StreamPtr sineWave(const RenderConfig &config, double frequency);
StreamPtr triangleWave(const RenderConfig &config, double frequency);
StreamPtr sawtoothWave(const RenderConfig &config, double frequency);
StreamPtr whiteNoise(std::uint32_t seed = 0);

// Dispatch on form. Square is a bipolar rectangular wave at dutyCycle.
StreamPtr oscillator(const RenderConfig &config, WaveForm form,
                     double frequency, double dutyCycle = 0.5,
                     std::uint32_t seed = 0);

// round(duration * sampleRate) samples from start towards end. The last
// sample is one step short of end.
StreamPtr linearChange(const RenderConfig &config, double duration,
                       Sample start, Sample end);

// ---- Transforms ----

// Exactly round(numSeconds * sampleRate) samples of stream. Pulling past the
// end of a finite source throws StreamExhaustedError.
StreamPtr timeLimit(const RenderConfig &config, StreamPtr stream,
                    double numSeconds);

// Elementwise product; ends with the shorter operand.
StreamPtr scale(StreamPtr a, StreamPtr b);

// Each stream in turn. Only the last one may be unbounded.
StreamPtr concatenate(std::vector<StreamPtr> streams);

template <typename... Streams>
StreamPtr concatenate(StreamPtr first, Streams... rest) {
  std::vector<StreamPtr> streams;
  streams.push_back(std::move(first));
  (streams.push_back(std::move(rest)), ...);
  return concatenate(std::move(streams));
}

// Samples per cycle for frequency, validated.
long cycleLength(const RenderConfig &config, double frequency);

// Samples covered by duration seconds, validated.
long sampleCount(const RenderConfig &config, double duration);

} // namespace Sound

#endif
