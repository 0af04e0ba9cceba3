#ifndef WAVESYNTH_SCORE_HPP
#define WAVESYNTH_SCORE_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

#include "adsr.hpp"
#include "config.hpp"
#include "note.hpp"
#include "notes.hpp"
#include "sound.hpp"

// How every note of a score sounds.
class Instrument {
public:
  Sound::WaveForm waveForm = Sound::WaveForm::Sine;
  double dutyCycle = 0.5; // square only
  double volume = 0.5;
  ADSR adsr;

  // scale(scale(oscillator, hold(volume)), envelope), exactly as long as
  // the envelope.
  Sound::StreamPtr play(const RenderConfig &config, double frequency,
                        double seconds) const;

  nlohmann::json toJson() const {
    return {{"waveForm", Sound::typeOfWave(waveForm)},
            {"dutyCycle", dutyCycle},
            {"volume", volume},
            {"adsr", adsr.toJson()}};
  }

  static std::optional<Instrument> fromJson(const nlohmann::json &j);
};

class Score {
public:
  notes::TuningSystem tuning = notes::TuningSystem::EqualTemperament;
  Instrument instrument;
  std::vector<Note> melody;

  void addNote(const Note &note) { this->melody.push_back(note); }

  // Every note in order as one finite stream. Rests are silence. Throws
  // MalformedNoteError for a bad pitch.
  Sound::StreamPtr toStream(const RenderConfig &config) const;

  // Total length in seconds at the configured tempo.
  double duration(const RenderConfig &config) const;

  nlohmann::json toJson() const;
  static std::optional<Score> fromJson(const nlohmann::json &j);
};

#endif
