#include "sound.hpp"

#include <cmath>
#include <limits>
#include <random>

const double PI = 3.14159265358979323846;

namespace {

using Sound::Sample;
using Sound::StreamPtr;

class Hold : public Sound::SampleStream {
public:
  explicit Hold(Sample level) : level(level) {}
  std::optional<Sample> next() override { return this->level; }
  bool bounded() const override { return false; }

private:
  Sample level;
};

// One cycle of cycle samples, repeated forever. Square uses the first
// highCount samples of each cycle for high and the rest for low.
class Oscillator : public Sound::SampleStream {
public:
  Oscillator(Sound::WaveForm form, long cycle, long highCount = 0,
             Sample low = 0.0, Sample high = 1.0)
      : form(form), cycle(cycle), highCount(highCount), low(low), high(high) {}

  std::optional<Sample> next() override {
    Sample value = this->shape(this->index);
    this->index = (this->index + 1) % this->cycle;
    return value;
  }
  bool bounded() const override { return false; }

private:
  Sample shape(long i) const {
    double phase = static_cast<double>(i) / this->cycle;
    switch (this->form) {
    case Sound::Sine:
      return std::sin(2.0 * PI * phase);
    case Sound::Triangular:
      if (phase < 0.25)
        return 4.0 * phase;
      if (phase < 0.75)
        return 2.0 - 4.0 * phase;
      return 4.0 * phase - 4.0;
    case Sound::Square:
      return i < this->highCount ? this->high : this->low;
    case Sound::Saw:
      return -1.0 + 2.0 * phase;
    case Sound::WhiteNoise:
      break;
    }
    return 0.0;
  }

  Sound::WaveForm form;
  long cycle;
  long highCount;
  Sample low;
  Sample high;
  long index = 0;
};

class Noise : public Sound::SampleStream {
public:
  explicit Noise(std::uint32_t seed) : generator(seed), distribution(-1.0, 1.0) {}
  std::optional<Sample> next() override {
    return this->distribution(this->generator);
  }
  bool bounded() const override { return false; }

private:
  std::mt19937 generator;
  std::uniform_real_distribution<double> distribution;
};

class LinearChange : public Sound::SampleStream {
public:
  LinearChange(long count, Sample start, Sample end)
      : count(count), start(start), end(end) {}

  std::optional<Sample> next() override {
    if (this->index >= this->count)
      return std::nullopt;
    Sample value =
        this->start + this->index * (this->end - this->start) / this->count;
    this->index++;
    return value;
  }
  bool bounded() const override { return true; }

private:
  long count;
  Sample start;
  Sample end;
  long index = 0;
};

class TimeLimit : public Sound::SampleStream {
public:
  TimeLimit(StreamPtr source, long limit)
      : source(std::move(source)), limit(limit) {}

  std::optional<Sample> next() override {
    if (this->index >= this->limit)
      return std::nullopt;
    std::optional<Sample> sample = this->source->next();
    if (!sample)
      throw StreamExhaustedError(this->index, this->limit);
    this->index++;
    return sample;
  }
  bool bounded() const override { return true; }

private:
  StreamPtr source;
  long limit;
  long index = 0;
};

class Scale : public Sound::SampleStream {
public:
  Scale(StreamPtr a, StreamPtr b) : a(std::move(a)), b(std::move(b)) {}

  std::optional<Sample> next() override {
    std::optional<Sample> x = this->a->next();
    if (!x)
      return std::nullopt;
    std::optional<Sample> y = this->b->next();
    if (!y)
      return std::nullopt;
    return *x * *y;
  }
  bool bounded() const override { return a->bounded() || b->bounded(); }

private:
  StreamPtr a;
  StreamPtr b;
};

class Concatenation : public Sound::SampleStream {
public:
  explicit Concatenation(std::vector<StreamPtr> streams)
      : streams(std::move(streams)) {}

  std::optional<Sample> next() override {
    while (this->current < this->streams.size()) {
      std::optional<Sample> sample = this->streams[this->current]->next();
      if (sample)
        return sample;
      // Done with this one, drop it.
      this->streams[this->current].reset();
      this->current++;
    }
    return std::nullopt;
  }
  bool bounded() const override {
    if (this->current >= this->streams.size())
      return true;
    return this->streams.back()->bounded();
  }

private:
  std::vector<StreamPtr> streams;
  size_t current = 0;
};

void requireStream(const StreamPtr &stream, const char *operation) {
  if (!stream)
    throw InvalidParameterError(std::string(operation) + ": null stream");
}

} // namespace

std::string Sound::typeOfWave(Sound::WaveForm form) {
  switch (form) {
  case Sine:
    return "sine";
  case Triangular:
    return "triangular";
  case Square:
    return "square";
  case Saw:
    return "saw";
  case WhiteNoise:
    return "white_noise";
  }
  return "none";
}

std::optional<Sound::WaveForm> Sound::waveFromString(const std::string &str) {
  if (str == "sine")
    return Sine;
  if (str == "triangular")
    return Triangular;
  if (str == "square")
    return Square;
  if (str == "saw")
    return Saw;
  if (str == "white_noise")
    return WhiteNoise;
  return std::nullopt;
}

long Sound::cycleLength(const RenderConfig &config, double frequency) {
  if (!std::isfinite(frequency) || frequency <= 0.0)
    throw InvalidParameterError("Frequency must be positive, got " +
                                std::to_string(frequency));

  double samples = config.getSampleRate() / frequency;
  if (samples >= static_cast<double>(std::numeric_limits<long>::max()))
    throw InvalidParameterError("Frequency " + std::to_string(frequency) +
                                " Hz is too low");

  long cycle = std::lround(samples);
  if (cycle < 1)
    throw InvalidParameterError(
        "Frequency " + std::to_string(frequency) +
        " Hz has no whole-sample cycle at " +
        std::to_string(config.getSampleRate()) + " Hz");
  return cycle;
}

long Sound::sampleCount(const RenderConfig &config, double duration) {
  if (!std::isfinite(duration) || duration <= 0.0)
    throw InvalidParameterError("Duration must be positive, got " +
                                std::to_string(duration));

  double samples = duration * config.getSampleRate();
  if (samples >= static_cast<double>(std::numeric_limits<long>::max()))
    throw InvalidParameterError("Duration " + std::to_string(duration) +
                                " s is too long");
  return std::lround(samples);
}

Sound::StreamPtr Sound::hold(Sample level) {
  if (!std::isfinite(level))
    throw InvalidParameterError("Hold level must be finite");
  return std::make_unique<Hold>(level);
}

Sound::StreamPtr Sound::silence() { return hold(0.0); }

Sound::StreamPtr Sound::rectangularWave(const RenderConfig &config,
                                        double frequency, double dutyCycle,
                                        Sample min, Sample max) {
  if (!(dutyCycle >= 0.0 && dutyCycle <= 1.0))
    throw InvalidParameterError("Duty cycle must be within [0, 1], got " +
                                std::to_string(dutyCycle));

  long cycle = cycleLength(config, frequency);
  long highCount = std::lround(dutyCycle * cycle);
  return std::make_unique<Oscillator>(Square, cycle, highCount, min, max);
}

Sound::StreamPtr Sound::sineWave(const RenderConfig &config, double frequency) {
  return std::make_unique<Oscillator>(Sine, cycleLength(config, frequency));
}

Sound::StreamPtr Sound::triangleWave(const RenderConfig &config,
                                     double frequency) {
  return std::make_unique<Oscillator>(Triangular,
                                      cycleLength(config, frequency));
}

Sound::StreamPtr Sound::sawtoothWave(const RenderConfig &config,
                                     double frequency) {
  return std::make_unique<Oscillator>(Saw, cycleLength(config, frequency));
}

Sound::StreamPtr Sound::whiteNoise(std::uint32_t seed) {
  return std::make_unique<Noise>(seed);
}

Sound::StreamPtr Sound::oscillator(const RenderConfig &config, WaveForm form,
                                   double frequency, double dutyCycle,
                                   std::uint32_t seed) {
  switch (form) {
  case Sine:
    return sineWave(config, frequency);
  case Triangular:
    return triangleWave(config, frequency);
  case Square:
    return rectangularWave(config, frequency, dutyCycle, -1.0, 1.0);
  case Saw:
    return sawtoothWave(config, frequency);
  case WhiteNoise:
    return whiteNoise(seed);
  }
  throw InvalidParameterError("Unknown wave form");
}

Sound::StreamPtr Sound::linearChange(const RenderConfig &config,
                                     double duration, Sample start,
                                     Sample end) {
  return std::make_unique<LinearChange>(sampleCount(config, duration), start,
                                        end);
}

Sound::StreamPtr Sound::timeLimit(const RenderConfig &config, StreamPtr stream,
                                  double numSeconds) {
  requireStream(stream, "timeLimit");
  long limit = sampleCount(config, numSeconds);
  return std::make_unique<TimeLimit>(std::move(stream), limit);
}

Sound::StreamPtr Sound::scale(StreamPtr a, StreamPtr b) {
  requireStream(a, "scale");
  requireStream(b, "scale");
  return std::make_unique<Scale>(std::move(a), std::move(b));
}

Sound::StreamPtr Sound::concatenate(std::vector<StreamPtr> streams) {
  for (size_t i = 0; i < streams.size(); i++) {
    requireStream(streams[i], "concatenate");
    if (i + 1 < streams.size() && !streams[i]->bounded())
      throw InvalidParameterError("concatenate: stream " + std::to_string(i) +
                                  " never ends, so the streams after it are "
                                  "unreachable");
  }
  return std::make_unique<Concatenation>(std::move(streams));
}
