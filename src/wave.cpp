#include "wave.hpp"

#include <cmath>
#include <cstring>
#include <filesystem>
#include <limits>
#include <system_error>

namespace {

// Largest data chunk a 32-bit RIFF size field can describe.
constexpr std::uint64_t MAX_DATA_SIZE =
    std::numeric_limits<std::uint32_t>::max() - (Wave::HEADER_SIZE - 8);

void putLE(std::ostream &out, std::uint32_t value, int len) {
  for (int i = 0; i < len; i++)
    out.put(static_cast<char>((value >> (8 * i)) & 0xFF));
}

std::uint32_t convertToInt(const char *buffer, int len) {
  std::uint32_t a = 0;
  for (int i = 0; i < len; i++)
    a |= static_cast<std::uint32_t>(static_cast<unsigned char>(buffer[i]))
         << (8 * i);
  return a;
}

} // namespace

std::optional<std::int16_t> Wave::quantize(Sound::Sample sample) {
  if (!std::isfinite(sample))
    return std::nullopt;
  double scaled = std::round(32767.0 * sample);
  if (scaled < std::numeric_limits<std::int16_t>::min() ||
      scaled > std::numeric_limits<std::int16_t>::max())
    return std::nullopt;
  return static_cast<std::int16_t>(scaled);
}

Wave::Writer::Writer(const std::string &path, const RenderConfig &config)
    : path(path), tmpPath(path + ".part"),
      sampleRate(config.getSampleRate()), channels(config.getChannels()),
      bitsPerSample(config.getBitsPerSample()) {
  this->out.open(this->tmpPath, std::ios::binary | std::ios::trunc);
  if (!this->out.is_open())
    throw EncodingError("Failed to open " + this->tmpPath + " for writing");

  // Sizes are patched by finalize().
  this->writeHeader(0);
  if (!this->out) {
    this->discard();
    throw EncodingError("Failed to write header to " + this->tmpPath);
  }
}

Wave::Writer::~Writer() {
  if (!this->finalized)
    this->discard();
}

void Wave::Writer::writeHeader(std::uint32_t dataSize) {
  std::uint32_t blockAlign = this->channels * (this->bitsPerSample / 8);
  std::uint32_t byteRate = this->sampleRate * blockAlign;

  this->out.write("RIFF", 4);
  putLE(this->out, HEADER_SIZE - 8 + dataSize, 4);
  this->out.write("WAVE", 4);
  this->out.write("fmt ", 4);
  putLE(this->out, 16, 4);
  putLE(this->out, FORMAT_PCM, 2);
  putLE(this->out, this->channels, 2);
  putLE(this->out, this->sampleRate, 4);
  putLE(this->out, byteRate, 4);
  putLE(this->out, blockAlign, 2);
  putLE(this->out, this->bitsPerSample, 2);
  this->out.write("data", 4);
  putLE(this->out, dataSize, 4);
}

bool Wave::Writer::write(std::int16_t frame) {
  if (this->finalized)
    return false;
  if (static_cast<std::uint64_t>(this->frames + 1) * 2 > MAX_DATA_SIZE)
    return false;

  putLE(this->out, static_cast<std::uint16_t>(frame), 2);
  if (!this->out)
    return false;
  this->frames++;
  return true;
}

void Wave::Writer::finalize() {
  if (this->finalized)
    return;

  this->out.seekp(0);
  this->writeHeader(static_cast<std::uint32_t>(this->frames * 2));
  this->out.flush();
  this->out.close();
  if (this->out.fail())
    throw EncodingError("Failed to finalize " + this->tmpPath);

  std::error_code ec;
  std::filesystem::rename(this->tmpPath, this->path, ec);
  if (ec)
    throw EncodingError("Failed to move " + this->tmpPath + " to " +
                        this->path + ": " + ec.message());
  this->finalized = true;
}

void Wave::Writer::discard() {
  if (this->out.is_open())
    this->out.close();
  std::error_code ec;
  std::filesystem::remove(this->tmpPath, ec);
}

long Wave::render(Sound::SampleStream &stream, const std::string &path,
                  const RenderConfig &config) {
  if (!stream.bounded())
    throw InvalidParameterError(
        "Cannot render a stream that never ends; limit it with timeLimit");

  Writer writer(path, config);
  long index = 0;
  while (std::optional<Sound::Sample> sample = stream.next()) {
    std::optional<std::int16_t> frame = quantize(*sample);
    if (!frame)
      throw QuantizationError(index, *sample);
    if (!writer.write(*frame))
      throw EncodingError("Failed to write sample " + std::to_string(index) +
                              " with value " + std::to_string(*sample) +
                              " to " + writer.getTemporaryPath(),
                          index, *sample);
    index++;
  }
  writer.finalize();
  return writer.getFrames();
}

std::optional<Wave::WaveFile> Wave::read(const std::string &filename) {
  char buffer[4];
  std::ifstream in(filename, std::ios::binary);
  if (!in.is_open())
    return std::nullopt;

  in.seekg(0, std::ios::end);
  const std::streamoff fileSize = in.tellg();
  in.seekg(0, std::ios::beg);
  if (fileSize < 0)
    return std::nullopt;

  in.read(buffer, 4);
  if (!in || strncmp(buffer, "RIFF", 4) != 0)
    return std::nullopt;
  in.read(buffer, 4); // size
  in.read(buffer, 4);
  if (!in || strncmp(buffer, "WAVE", 4) != 0)
    return std::nullopt;

  WaveFile wave;
  bool fmtRead = false;
  int audioFormat = 0;
  while (in.read(buffer, 4)) {
    char chunkId[4];
    std::memcpy(chunkId, buffer, 4);
    in.read(buffer, 4);
    if (!in)
      return std::nullopt;
    std::uint32_t chunkSize = convertToInt(buffer, 4);

    if (strncmp(chunkId, "fmt ", 4) == 0) {
      if (chunkSize < 16)
        return std::nullopt;
      char fmt[16];
      in.read(fmt, 16);
      audioFormat = convertToInt(fmt, 2);
      wave.channels = convertToInt(fmt + 2, 2);
      wave.sampleRate = convertToInt(fmt + 4, 4);
      wave.bitsPerSample = convertToInt(fmt + 14, 2);
      in.ignore(chunkSize - 16 + (chunkSize % 2));
      fmtRead = true;
    } else if (strncmp(chunkId, "data", 4) == 0) {
      if (!fmtRead || audioFormat != FORMAT_PCM || wave.bitsPerSample != 16)
        return std::nullopt;
      // The size field is untrusted; never allocate past the end of file.
      if (static_cast<std::streamoff>(chunkSize) >
          fileSize - static_cast<std::streamoff>(in.tellg()))
        return std::nullopt;
      std::vector<char> data(chunkSize);
      in.read(data.data(), chunkSize);
      if (!in)
        return std::nullopt;
      wave.samples.resize(chunkSize / 2);
      for (size_t i = 0; i < wave.samples.size(); i++)
        wave.samples[i] = static_cast<short>(
            static_cast<std::uint16_t>(convertToInt(&data[2 * i], 2)));
      return wave;
    } else {
      // JUNK, LIST and anything else, padded to an even size
      in.ignore(chunkSize + (chunkSize % 2));
    }
    if (!in)
      return std::nullopt;
  }
  return std::nullopt;
}
