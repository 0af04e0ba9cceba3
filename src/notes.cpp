#include "notes.hpp"

#include <cmath>
#include <limits>

namespace {

struct PitchClass {
  const char *name;
  const char *alias; // enharmonic flat spelling, same as name for naturals
  int offset;        // semitones from A
};

const PitchClass PITCH_CLASSES[12] = {
    {"C", "C", -9},   {"C#", "Db", -8}, {"D", "D", -7},  {"D#", "Eb", -6},
    {"E", "E", -5},   {"F", "F", -4},   {"F#", "Gb", -3}, {"G", "G", -2},
    {"G#", "Ab", -1}, {"A", "A", 0},    {"A#", "Bb", 1},  {"B", "B", 2}};

// Werckmeister III, cents above C, indexed like PITCH_CLASSES.
const double WERCKMEISTER_CENTS[12] = {0.0,     90.225,  192.180, 294.135,
                                       390.225, 498.045, 588.270, 696.090,
                                       792.180, 888.270, 996.090, 1092.180};

constexpr int A_INDEX = 9;
constexpr int MAX_OCTAVE_DIGITS = 2;

struct DurationEntry {
  notes::Duration duration;
  const char *name;
  double ratio;
};

const DurationEntry DURATIONS[notes::NUM_DURATIONS] = {
    {notes::Duration::Whole, "whole", 4.0},
    {notes::Duration::DottedWhole, "dotted_whole", 6.0},
    {notes::Duration::Half, "half", 2.0},
    {notes::Duration::DottedHalf, "dotted_half", 3.0},
    {notes::Duration::Quarter, "quarter", 1.0},
    {notes::Duration::DottedQuarter, "dotted_quarter", 1.5},
    {notes::Duration::Eighth, "eighth", 0.5},
    {notes::Duration::DottedEighth, "dotted_eighth", 0.75},
    {notes::Duration::Sixteenth, "sixteenth", 0.25},
    {notes::Duration::DottedSixteenth, "dotted_sixteenth", 0.375},
    {notes::Duration::ThirtySecond, "thirty_second", 0.125},
    {notes::Duration::DottedThirtySecond, "dotted_thirty_second", 0.1875}};

const DurationEntry &lookupDuration(notes::Duration d) {
  for (const auto &entry : DURATIONS) {
    if (entry.duration == d)
      return entry;
  }
  throw std::invalid_argument("Invalid Duration enum");
}

} // namespace

notes::Pitch notes::parseNote(const std::string &note) {
  if (note.empty() || note[0] < 'A' || note[0] > 'G')
    throw MalformedNoteError(note);

  std::string token(1, note[0]);
  size_t pos = 1;
  if (pos < note.size() && (note[pos] == '#' || note[pos] == 'b')) {
    token += note[pos];
    pos++;
  }

  const PitchClass *pitchClass = nullptr;
  for (const auto &pc : PITCH_CLASSES) {
    if (token == pc.name || token == pc.alias) {
      pitchClass = &pc;
      break;
    }
  }
  if (pitchClass == nullptr)
    throw MalformedNoteError(note);

  int octave = DEFAULT_OCTAVE;
  if (pos < note.size()) {
    bool negative = false;
    if (note[pos] == '-') {
      negative = true;
      pos++;
    }
    size_t digits = note.size() - pos;
    if (digits == 0 || digits > MAX_OCTAVE_DIGITS)
      throw MalformedNoteError(note);

    int value = 0;
    for (; pos < note.size(); pos++) {
      if (note[pos] < '0' || note[pos] > '9')
        throw MalformedNoteError(note);
      value = value * 10 + (note[pos] - '0');
    }
    octave = negative ? -value : value;
  }

  return Pitch{pitchClass->offset, octave};
}

double notes::getFrequency(const std::string &note, TuningSystem ts) {
  Pitch pitch = parseNote(note);
  double octaveFactor = std::pow(2.0, pitch.octave - DEFAULT_OCTAVE);

  switch (ts) {
  case TuningSystem::EqualTemperament:
    return A4_FREQUENCY * std::pow(2.0, pitch.semitoneOffset / 12.0) *
           octaveFactor;
  case TuningSystem::WerckmeisterIII: {
    int index = pitch.semitoneOffset + A_INDEX;
    double cents = WERCKMEISTER_CENTS[index] - WERCKMEISTER_CENTS[A_INDEX];
    return A4_FREQUENCY * std::pow(2.0, cents / 1200.0) * octaveFactor;
  }
  }
  throw std::invalid_argument("Invalid TuningSystem enum");
}

std::string notes::getClosestNote(double frequency, TuningSystem ts) {
  if (!std::isfinite(frequency) || frequency <= 0.0)
    throw InvalidParameterError("Frequency must be positive, got " +
                                std::to_string(frequency));

  std::string closest;
  double best = std::numeric_limits<double>::max();
  for (int octave = 0; octave <= 8; octave++) {
    for (const auto &pc : PITCH_CLASSES) {
      std::string name = pc.name + std::to_string(octave);
      double distance = std::fabs(std::log2(frequency / getFrequency(name, ts)));
      if (distance < best) {
        best = distance;
        closest = name;
      }
    }
  }
  return closest;
}

double notes::durationRatio(Duration d) { return lookupDuration(d).ratio; }

std::string notes::durationToString(Duration d) {
  return lookupDuration(d).name;
}

std::optional<notes::Duration>
notes::durationFromString(const std::string &str) {
  for (const auto &entry : DURATIONS) {
    if (str == entry.name)
      return entry.duration;
  }
  return std::nullopt;
}

double notes::resolveDuration(Duration d, double tempo) {
  if (!std::isfinite(tempo) || tempo <= 0.0)
    throw InvalidParameterError("Tempo must be positive, got " +
                                std::to_string(tempo));
  return durationRatio(d) * 60.0 / tempo;
}
