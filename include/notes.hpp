#ifndef WAVESYNTH_NOTES_HPP
#define WAVESYNTH_NOTES_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "errors.hpp"

namespace notes {

constexpr double A4_FREQUENCY = 440.0;
constexpr int DEFAULT_OCTAVE = 4;

enum class TuningSystem { EqualTemperament, WerckmeisterIII };

// --- JSON serialization for TuningSystem ---
inline void to_json(nlohmann::json &j, const TuningSystem &t) {
  switch (t) {
  case TuningSystem::EqualTemperament:
    j = "EqualTemperament";
    break;
  case TuningSystem::WerckmeisterIII:
    j = "WerckmeisterIII";
    break;
  }
}

inline void from_json(const nlohmann::json &j, TuningSystem &t) {
  const std::string s = j.get<std::string>();
  if (s == "EqualTemperament") {
    t = TuningSystem::EqualTemperament;
  } else if (s == "WerckmeisterIII") {
    t = TuningSystem::WerckmeisterIII;
  } else {
    throw std::invalid_argument("Invalid TuningSystem: " + s);
  }
}

// Convert enum → string
inline std::string tuningToString(TuningSystem ts) {
  switch (ts) {
  case TuningSystem::EqualTemperament:
    return "EqualTemperament";
  case TuningSystem::WerckmeisterIII:
    return "WerckmeisterIII";
  }
  throw std::invalid_argument("Invalid TuningSystem enum");
}

// Symbolic note lengths. Ratios are relative to a quarter note.
enum class Duration {
  Whole,
  DottedWhole,
  Half,
  DottedHalf,
  Quarter,
  DottedQuarter,
  Eighth,
  DottedEighth,
  Sixteenth,
  DottedSixteenth,
  ThirtySecond,
  DottedThirtySecond
};

constexpr int NUM_DURATIONS = 12;

// A parsed note token: pitch class offset from A in semitones (-9..2) and
// the octave.
struct Pitch {
  int semitoneOffset;
  int octave;
};

Pitch parseNote(const std::string &note);

// Frequency of a note name such as "A4", "C#", "Eb3". Throws
// MalformedNoteError.
double getFrequency(const std::string &note,
                    TuningSystem ts = TuningSystem::EqualTemperament);

// Nearest sharp-spelled note name in octaves 0..8.
std::string getClosestNote(double frequency,
                           TuningSystem ts = TuningSystem::EqualTemperament);

double durationRatio(Duration d);
std::string durationToString(Duration d);
std::optional<Duration> durationFromString(const std::string &str);

// Seconds taken by a note of the given length at tempo quarter notes per
// minute.
double resolveDuration(Duration d, double tempo);

} // namespace notes

#endif
