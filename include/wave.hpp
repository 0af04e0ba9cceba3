#ifndef WAVESYNTH_WAVE_HPP
#define WAVESYNTH_WAVE_HPP

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "sound.hpp"

namespace Wave {

// Canonical 44-byte header: RIFF chunk, 16-byte fmt chunk, data chunk.
constexpr std::uint32_t HEADER_SIZE = 44;
constexpr std::uint16_t FORMAT_PCM = 1;

/*
 * Contents of a mono or multi-channel 16-bit PCM file, interleaved.
 */
struct WaveFile {
  int channels = 0;
  int sampleRate = 0;
  int bitsPerSample = 0;
  std::vector<short> samples;

  long frames() const {
    return channels > 0 ? static_cast<long>(samples.size()) / channels : 0;
  }
};

// round(32767 * sample), or nothing if that is not a 16-bit value.
std::optional<std::int16_t> quantize(Sound::Sample sample);

// Owns the output file for one render. Frames are written to a temporary
// sibling file; finalize() patches the header and moves it onto path. If the
// writer goes away without finalize() the temporary file is deleted, so an
// existing file at path is never touched by a failed render.
class Writer {
public:
  Writer(const std::string &path, const RenderConfig &config);
  ~Writer();

  Writer(const Writer &) = delete;
  Writer &operator=(const Writer &) = delete;

  // False if the frame could not be written.
  bool write(std::int16_t frame);
  void finalize();

  long getFrames() const { return frames; }
  const std::string &getTemporaryPath() const { return tmpPath; }

private:
  void writeHeader(std::uint32_t dataSize);
  void discard();

  std::string path;
  std::string tmpPath;
  std::ofstream out;
  int sampleRate;
  int channels;
  int bitsPerSample;
  long frames = 0;
  bool finalized = false;
};

// Pull every sample of stream into a WAV file at path. Returns the number of
// frames written. Throws InvalidParameterError for an unbounded stream,
// QuantizationError or EncodingError for a sample that cannot be stored, and
// lets StreamExhaustedError through. Nothing is left at path on failure.
long render(Sound::SampleStream &stream, const std::string &path,
            const RenderConfig &config);

// Parse a 16-bit PCM WAV file. Unknown chunks are skipped.
std::optional<WaveFile> read(const std::string &filename);

} // namespace Wave

#endif
