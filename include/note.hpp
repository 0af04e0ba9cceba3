#ifndef WAVESYNTH_NOTE_HPP
#define WAVESYNTH_NOTE_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>

#include "notes.hpp"

// One entry of a score: a note name (or "R" for a rest) and its length.
class Note {
public:
  static constexpr const char *REST = "R";

  Note(std::string pitch, notes::Duration duration)
      : pitch(std::move(pitch)), duration(duration) {}

  bool isRest() const { return this->pitch == REST; }

  double getFrequency(notes::TuningSystem ts) const {
    return notes::getFrequency(this->pitch, ts);
  }
  double getSeconds(double tempo) const {
    return notes::resolveDuration(this->duration, tempo);
  }

  nlohmann::json toJson() const {
    return {{"pitch", pitch}, {"duration", notes::durationToString(duration)}};
  }

  // Accepts {"pitch": "C4", "duration": "quarter"} or ["C4", "quarter"].
  // The pitch is only checked when the note is resolved.
  static std::optional<Note> fromJson(const nlohmann::json &j) {
    nlohmann::json pitch, duration;
    if (j.is_array() && j.size() == 2) {
      pitch = j[0];
      duration = j[1];
    } else if (j.is_object() && j.contains("pitch") &&
               j.contains("duration")) {
      pitch = j["pitch"];
      duration = j["duration"];
    } else {
      return std::nullopt;
    }

    if (!pitch.is_string() || !duration.is_string())
      return std::nullopt;

    auto kind = notes::durationFromString(duration.get<std::string>());
    if (!kind)
      return std::nullopt;

    return Note(pitch.get<std::string>(), *kind);
  }

  std::string pitch;
  notes::Duration duration;
};

#endif
