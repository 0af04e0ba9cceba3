// Tests for sound.hpp -- sources, transforms and boundedness.

#include "sound.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <vector>

#include "test_helpers.h"

namespace {

using test_helpers::drain;
using test_helpers::take;

const RenderConfig kConfig;

// ---------------------------------------------------------------------------
// hold / silence
// ---------------------------------------------------------------------------

TEST(SoundTest, HoldRepeatsLevel) {
  auto stream = Sound::hold(0.25);
  EXPECT_FALSE(stream->bounded());
  for (auto sample : take(*stream, 1000)) EXPECT_DOUBLE_EQ(sample, 0.25);
}

TEST(SoundTest, SilenceIsZero) {
  auto stream = Sound::silence();
  EXPECT_FALSE(stream->bounded());
  for (auto sample : take(*stream, 100)) EXPECT_DOUBLE_EQ(sample, 0.0);
}

// ---------------------------------------------------------------------------
// rectangularWave
// ---------------------------------------------------------------------------

TEST(SoundTest, RectangularCountsPerCycle) {
  for (double frequency : {100.0, 261.63, 440.0, 1000.0, 5000.0}) {
    long cycle = std::lround(44100.0 / frequency);
    for (double duty : {0.0, 0.1, 0.25, 0.5, 0.75, 0.9, 1.0}) {
      auto stream = Sound::rectangularWave(kConfig, frequency, duty, -0.5, 0.75);
      long expectedHigh = std::lround(duty * cycle);
      for (int c = 0; c < 3; ++c) {
        auto samples = take(*stream, cycle);
        long highs = std::count(samples.begin(), samples.end(), 0.75);
        long lows = std::count(samples.begin(), samples.end(), -0.5);
        EXPECT_EQ(highs, expectedHigh) << frequency << " Hz duty " << duty;
        EXPECT_EQ(highs + lows, cycle) << frequency << " Hz duty " << duty;
      }
    }
  }
}

TEST(SoundTest, RectangularHighComesFirst) {
  // 441 Hz is exactly 100 samples per cycle.
  auto stream = Sound::rectangularWave(kConfig, 441.0, 0.3);
  auto samples = take(*stream, 100);
  for (int i = 0; i < 30; ++i) EXPECT_DOUBLE_EQ(samples[i], 1.0) << i;
  for (int i = 30; i < 100; ++i) EXPECT_DOUBLE_EQ(samples[i], 0.0) << i;
  EXPECT_DOUBLE_EQ(*stream->next(), 1.0);
}

TEST(SoundTest, RectangularHalfSampleRoundsUp) {
  // A 101-sample cycle at duty 0.5 asks for 50.5 high samples.
  double frequency = 44100.0 / 101;
  ASSERT_EQ(Sound::cycleLength(kConfig, frequency), 101);
  auto stream = Sound::rectangularWave(kConfig, frequency, 0.5);
  auto samples = take(*stream, 101);
  EXPECT_EQ(std::count(samples.begin(), samples.end(), 1.0), 51);
}

TEST(SoundTest, RectangularRejectsDutyOutsideUnitRange) {
  EXPECT_THROW(Sound::rectangularWave(kConfig, 440.0, -0.01), InvalidParameterError);
  EXPECT_THROW(Sound::rectangularWave(kConfig, 440.0, 1.01), InvalidParameterError);
  EXPECT_THROW(Sound::rectangularWave(kConfig, 440.0, std::nan("")), InvalidParameterError);
}

TEST(SoundTest, RoundedCycleDriftsNearSampleRate) {
  // 15000 Hz and 17000 Hz both round to a 3-sample cycle.
  EXPECT_EQ(Sound::cycleLength(kConfig, 15000.0), 3);
  EXPECT_EQ(Sound::cycleLength(kConfig, 17000.0), 3);
}

// ---------------------------------------------------------------------------
// sine / triangle / sawtooth
// ---------------------------------------------------------------------------

TEST(SoundTest, SineStartsAtZeroPeaksAtQuarter) {
  auto stream = Sound::sineWave(kConfig, 441.0);
  auto samples = take(*stream, 200);
  EXPECT_NEAR(samples[0], 0.0, 1e-12);
  EXPECT_NEAR(samples[25], 1.0, 1e-12);
  EXPECT_NEAR(samples[50], 0.0, 1e-12);
  EXPECT_NEAR(samples[75], -1.0, 1e-12);
  EXPECT_NEAR(samples[100], 0.0, 1e-12);
  EXPECT_NEAR(samples[125], 1.0, 1e-12);
}

TEST(SoundTest, SineUsesRoundedCycle) {
  long cycle = std::lround(44100.0 / 261.63);
  auto stream = Sound::sineWave(kConfig, 261.63);
  auto samples = take(*stream, cycle + 1);
  for (long i = 0; i < cycle; ++i)
    EXPECT_NEAR(samples[i], std::sin(2.0 * M_PI * i / cycle), 1e-12) << i;
  EXPECT_NEAR(samples[cycle], 0.0, 1e-12);
}

TEST(SoundTest, TriangleShape) {
  auto stream = Sound::triangleWave(kConfig, 441.0);
  auto samples = take(*stream, 101);
  EXPECT_NEAR(samples[0], 0.0, 1e-12);
  EXPECT_NEAR(samples[10], 0.4, 1e-12);
  EXPECT_NEAR(samples[25], 1.0, 1e-12);
  EXPECT_NEAR(samples[50], 0.0, 1e-12);
  EXPECT_NEAR(samples[75], -1.0, 1e-12);
  EXPECT_NEAR(samples[90], -0.4, 1e-12);
  EXPECT_NEAR(samples[100], 0.0, 1e-12);
  for (auto sample : samples) {
    EXPECT_LE(sample, 1.0);
    EXPECT_GE(sample, -1.0);
  }
}

TEST(SoundTest, SawtoothRisesThenResets) {
  auto stream = Sound::sawtoothWave(kConfig, 441.0);
  auto samples = take(*stream, 101);
  EXPECT_NEAR(samples[0], -1.0, 1e-12);
  EXPECT_NEAR(samples[50], 0.0, 1e-12);
  EXPECT_NEAR(samples[99], 0.98, 1e-12);
  EXPECT_NEAR(samples[100], -1.0, 1e-12);
  for (int i = 1; i < 100; ++i) EXPECT_GT(samples[i], samples[i - 1]) << i;
}

TEST(SoundTest, OscillatorsNeverEnd) {
  EXPECT_FALSE(Sound::sineWave(kConfig, 440.0)->bounded());
  EXPECT_FALSE(Sound::triangleWave(kConfig, 440.0)->bounded());
  EXPECT_FALSE(Sound::sawtoothWave(kConfig, 440.0)->bounded());
  EXPECT_FALSE(Sound::rectangularWave(kConfig, 440.0, 0.5)->bounded());
  EXPECT_FALSE(Sound::whiteNoise(7)->bounded());
}

TEST(SoundTest, InvalidFrequencies) {
  EXPECT_THROW(Sound::sineWave(kConfig, 0.0), InvalidParameterError);
  EXPECT_THROW(Sound::sineWave(kConfig, -440.0), InvalidParameterError);
  EXPECT_THROW(Sound::triangleWave(kConfig, INFINITY), InvalidParameterError);
  // round(44100 / 100000) == 0 samples per cycle.
  EXPECT_THROW(Sound::sawtoothWave(kConfig, 100000.0), InvalidParameterError);
  EXPECT_THROW(Sound::rectangularWave(kConfig, 100000.0, 0.5), InvalidParameterError);
}

TEST(SoundTest, WhiteNoiseIsSeededAndBounded) {
  auto a = Sound::whiteNoise(42);
  auto b = Sound::whiteNoise(42);
  auto first = take(*a, 1000);
  EXPECT_EQ(first, take(*b, 1000));
  for (auto sample : first) {
    EXPECT_GE(sample, -1.0);
    EXPECT_LE(sample, 1.0);
  }
  auto c = Sound::whiteNoise(43);
  EXPECT_NE(first, take(*c, 1000));
}

TEST(SoundTest, OscillatorDispatch) {
  auto square = Sound::oscillator(kConfig, Sound::Square, 441.0, 0.5);
  auto samples = take(*square, 100);
  EXPECT_EQ(std::count(samples.begin(), samples.end(), 1.0), 50);
  EXPECT_EQ(std::count(samples.begin(), samples.end(), -1.0), 50);

  auto sine = Sound::oscillator(kConfig, Sound::Sine, 441.0);
  EXPECT_NEAR(take(*sine, 26)[25], 1.0, 1e-12);
}

TEST(SoundTest, WaveNames) {
  for (auto form : {Sound::Sine, Sound::Triangular, Sound::Square, Sound::Saw,
                    Sound::WhiteNoise}) {
    auto parsed = Sound::waveFromString(Sound::typeOfWave(form));
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, form);
  }
  EXPECT_FALSE(Sound::waveFromString("pulse").has_value());
}

// ---------------------------------------------------------------------------
// linearChange
// ---------------------------------------------------------------------------

TEST(SoundTest, LinearChangeLengthAndEndpoints) {
  auto samples = drain(*Sound::linearChange(kConfig, 0.5, 0.0, 1.0));
  ASSERT_EQ(samples.size(), 22050u);
  EXPECT_DOUBLE_EQ(samples.front(), 0.0);
  EXPECT_DOUBLE_EQ(samples[11025], 0.5);
  // One step short of the end value.
  EXPECT_NEAR(samples.back(), 1.0 - 1.0 / 22050, 1e-12);
}

TEST(SoundTest, LinearChangeLengthIgnoresDirection) {
  for (double d : {0.001, 0.1, 0.33, 1.7}) {
    size_t expected = std::lround(d * 44100);
    EXPECT_EQ(drain(*Sound::linearChange(kConfig, d, 0.2, 0.9)).size(), expected);
    EXPECT_EQ(drain(*Sound::linearChange(kConfig, d, 0.9, 0.2)).size(), expected);
    EXPECT_EQ(drain(*Sound::linearChange(kConfig, d, -0.2, -0.9)).size(), expected);
    auto down = drain(*Sound::linearChange(kConfig, d, 0.9, 0.2));
    EXPECT_DOUBLE_EQ(down.front(), 0.9);
  }
}

TEST(SoundTest, LinearChangeIsBounded) {
  EXPECT_TRUE(Sound::linearChange(kConfig, 0.1, 1.0, 0.0)->bounded());
}

TEST(SoundTest, LinearChangeRejectsBadDuration) {
  EXPECT_THROW(Sound::linearChange(kConfig, 0.0, 0.0, 1.0), InvalidParameterError);
  EXPECT_THROW(Sound::linearChange(kConfig, -1.0, 0.0, 1.0), InvalidParameterError);
  EXPECT_THROW(Sound::linearChange(kConfig, std::nan(""), 0.0, 1.0),
               InvalidParameterError);
}

TEST(SoundTest, LinearChangeFollowsSampleRate) {
  RenderConfig config(8000);
  EXPECT_EQ(drain(*Sound::linearChange(config, 0.5, 0.0, 1.0)).size(), 4000u);
}

// ---------------------------------------------------------------------------
// timeLimit
// ---------------------------------------------------------------------------

TEST(SoundTest, TimeLimitTruncatesInfiniteSource) {
  auto stream = Sound::timeLimit(kConfig, Sound::sineWave(kConfig, 261.63), 1.0);
  EXPECT_TRUE(stream->bounded());
  EXPECT_EQ(drain(*stream).size(), 44100u);
  EXPECT_FALSE(stream->next().has_value());
}

TEST(SoundTest, TimeLimitPassesSamplesThrough) {
  auto stream =
      Sound::timeLimit(kConfig, Sound::linearChange(kConfig, 1.0, 0.0, 1.0), 0.5);
  auto samples = drain(*stream);
  ASSERT_EQ(samples.size(), 22050u);
  EXPECT_DOUBLE_EQ(samples[0], 0.0);
  EXPECT_DOUBLE_EQ(samples[100], 100.0 / 44100);
}

TEST(SoundTest, TimeLimitPastFiniteSourceThrows) {
  auto stream =
      Sound::timeLimit(kConfig, Sound::linearChange(kConfig, 1.0, 0.0, 1.0), 2.0);
  take(*stream, 44100);
  try {
    stream->next();
    FAIL() << "expected StreamExhaustedError";
  } catch (const StreamExhaustedError& e) {
    EXPECT_EQ(e.index, 44100);
    EXPECT_EQ(e.requested, 88200);
  }
}

TEST(SoundTest, TimeLimitRejectsBadArguments) {
  EXPECT_THROW(Sound::timeLimit(kConfig, Sound::silence(), 0.0), InvalidParameterError);
  EXPECT_THROW(Sound::timeLimit(kConfig, nullptr, 1.0), InvalidParameterError);
}

// ---------------------------------------------------------------------------
// scale
// ---------------------------------------------------------------------------

TEST(SoundTest, ScaleStopsAtShorterOperand) {
  auto a = Sound::linearChange(kConfig, 0.01, 0.0, 1.0);  // 441 samples
  auto b = Sound::linearChange(kConfig, 0.02, 1.0, 0.0);  // 882 samples
  auto expectedA = drain(*Sound::linearChange(kConfig, 0.01, 0.0, 1.0));
  auto expectedB = drain(*Sound::linearChange(kConfig, 0.02, 1.0, 0.0));

  auto samples = drain(*Sound::scale(std::move(a), std::move(b)));
  ASSERT_EQ(samples.size(), 441u);
  for (size_t i = 0; i < samples.size(); ++i)
    EXPECT_DOUBLE_EQ(samples[i], expectedA[i] * expectedB[i]) << i;

  auto shortSecond = Sound::scale(Sound::linearChange(kConfig, 0.02, 1.0, 0.0),
                                  Sound::linearChange(kConfig, 0.01, 0.0, 1.0));
  EXPECT_EQ(drain(*shortSecond).size(), 441u);
}

TEST(SoundTest, ScaleByHoldIsGain) {
  auto stream = Sound::scale(
      Sound::timeLimit(kConfig, Sound::sineWave(kConfig, 441.0), 0.01),
      Sound::hold(0.5));
  EXPECT_TRUE(stream->bounded());
  auto samples = drain(*stream);
  ASSERT_EQ(samples.size(), 441u);
  EXPECT_NEAR(samples[25], 0.5, 1e-12);
  EXPECT_NEAR(samples[75], -0.5, 1e-12);
}

TEST(SoundTest, ScaleOfTwoInfiniteStreamsIsUnbounded) {
  EXPECT_FALSE(
      Sound::scale(Sound::sineWave(kConfig, 440.0), Sound::hold(0.5))->bounded());
}

// ---------------------------------------------------------------------------
// concatenate
// ---------------------------------------------------------------------------

TEST(SoundTest, ConcatenateInOrder) {
  auto stream = Sound::concatenate(Sound::linearChange(kConfig, 0.01, 0.0, 1.0),
                                   Sound::timeLimit(kConfig, Sound::hold(-0.5), 0.02));
  EXPECT_TRUE(stream->bounded());
  auto samples = drain(*stream);
  ASSERT_EQ(samples.size(), 441u + 882u);
  EXPECT_DOUBLE_EQ(samples[0], 0.0);
  EXPECT_DOUBLE_EQ(samples[440], 440.0 / 441);
  for (size_t i = 441; i < samples.size(); ++i) EXPECT_DOUBLE_EQ(samples[i], -0.5);
}

TEST(SoundTest, ConcatenateVector) {
  std::vector<Sound::StreamPtr> parts;
  for (int i = 0; i < 4; ++i)
    parts.push_back(Sound::timeLimit(kConfig, Sound::hold(i * 0.25), 0.001));
  auto samples = drain(*Sound::concatenate(std::move(parts)));
  ASSERT_EQ(samples.size(), 4u * 44u);
  EXPECT_DOUBLE_EQ(samples[0], 0.0);
  EXPECT_DOUBLE_EQ(samples[44], 0.25);
  EXPECT_DOUBLE_EQ(samples[175], 0.75);
}

TEST(SoundTest, ConcatenateNothingIsEmpty) {
  auto stream = Sound::concatenate(std::vector<Sound::StreamPtr>{});
  EXPECT_TRUE(stream->bounded());
  EXPECT_FALSE(stream->next().has_value());
}

TEST(SoundTest, ConcatenateInfiniteLastIsUnbounded) {
  auto stream = Sound::concatenate(Sound::linearChange(kConfig, 0.001, 0.0, 1.0),
                                   Sound::hold(1.0));
  EXPECT_FALSE(stream->bounded());
  auto samples = take(*stream, 100);
  EXPECT_DOUBLE_EQ(samples[99], 1.0);
}

TEST(SoundTest, ConcatenateRejectsInfiniteBeforeLast) {
  EXPECT_THROW(Sound::concatenate(Sound::hold(1.0),
                                  Sound::linearChange(kConfig, 0.1, 0.0, 1.0)),
               InvalidParameterError);
}

}  // namespace
