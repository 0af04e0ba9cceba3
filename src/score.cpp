#include "score.hpp"

#include <stdexcept>

Sound::StreamPtr Instrument::play(const RenderConfig &config, double frequency,
                                  double seconds) const {
  Sound::StreamPtr tone = Sound::scale(
      Sound::oscillator(config, this->waveForm, frequency, this->dutyCycle),
      Sound::hold(this->volume));
  return Sound::scale(std::move(tone), this->adsr.envelope(config, seconds));
}

std::optional<Instrument> Instrument::fromJson(const nlohmann::json &j) {
  if (!j.is_object())
    return std::nullopt;

  Instrument instrument;

  if (j.contains("waveForm")) {
    if (!j["waveForm"].is_string())
      return std::nullopt;
    auto form = Sound::waveFromString(j["waveForm"].get<std::string>());
    if (!form)
      return std::nullopt;
    instrument.waveForm = *form;
  }

  if (j.contains("dutyCycle")) {
    if (!j["dutyCycle"].is_number())
      return std::nullopt;
    instrument.dutyCycle = j["dutyCycle"].get<double>();
    if (instrument.dutyCycle < 0.0 || instrument.dutyCycle > 1.0)
      return std::nullopt;
  }

  if (j.contains("volume")) {
    if (!j["volume"].is_number())
      return std::nullopt;
    instrument.volume = j["volume"].get<double>();
    if (instrument.volume < 0.0 || instrument.volume > 1.0)
      return std::nullopt;
  }

  if (j.contains("adsr")) {
    auto adsr = ADSR::fromJson(j["adsr"]);
    if (!adsr)
      return std::nullopt;
    instrument.adsr = *adsr;
  }

  return instrument;
}

Sound::StreamPtr Score::toStream(const RenderConfig &config) const {
  std::vector<Sound::StreamPtr> parts;
  parts.reserve(this->melody.size());

  for (const auto &note : this->melody) {
    double seconds = note.getSeconds(config.getTempo());
    if (note.isRest()) {
      parts.push_back(Sound::timeLimit(config, Sound::silence(), seconds));
    } else {
      parts.push_back(this->instrument.play(
          config, note.getFrequency(this->tuning), seconds));
    }
  }
  return Sound::concatenate(std::move(parts));
}

double Score::duration(const RenderConfig &config) const {
  double total = 0.0;
  for (const auto &note : this->melody)
    total += note.getSeconds(config.getTempo());
  return total;
}

nlohmann::json Score::toJson() const {
  std::vector<nlohmann::json> melodyJson;
  for (const auto &note : this->melody)
    melodyJson.push_back(note.toJson());

  return {{"tuning", this->tuning},
          {"instrument", this->instrument.toJson()},
          {"notes", melodyJson}};
}

std::optional<Score> Score::fromJson(const nlohmann::json &j) {
  if (!j.is_object() || !j.contains("notes") || !j["notes"].is_array())
    return std::nullopt;

  Score score;

  if (j.contains("tuning")) {
    if (!j["tuning"].is_string())
      return std::nullopt;
    try {
      score.tuning = j["tuning"].get<notes::TuningSystem>();
    } catch (const std::invalid_argument &) {
      return std::nullopt;
    }
  }

  if (j.contains("instrument")) {
    auto instrument = Instrument::fromJson(j["instrument"]);
    if (!instrument)
      return std::nullopt;
    score.instrument = *instrument;
  }

  for (const auto &node : j["notes"]) {
    auto note = Note::fromJson(node);
    if (!note)
      return std::nullopt;
    score.addNote(*note);
  }

  return score;
}
