#ifndef WAVESYNTH_ADSR_HPP
#define WAVESYNTH_ADSR_HPP

#include <nlohmann/json.hpp>
#include <optional>

#include "config.hpp"
#include "sound.hpp"

namespace Sound {

// Attack ramps 0 -> 1, decay 1 -> sustainLevel, sustain holds, release
// ramps sustainLevel -> 0. Durations in seconds; the result is finite.
StreamPtr linearAdsr(const RenderConfig &config, double attack, double decay,
                     double sustain, double release, double sustainLevel);

} // namespace Sound

// Envelope shape for a note of any length: the sustain phase takes whatever
// time attack, decay and release leave over.
class ADSR {
public:
  ADSR() {}
  ADSR(double attack, double decay, double release, double sustainLevel)
      : attack(attack), decay(decay), release(release),
        sustain_level(sustainLevel) {}

  // Envelope spanning noteDuration seconds. A note no longer than attack +
  // decay + release gets those three phases shrunk in proportion and no
  // sustain. Throws InvalidParameterError for a non-positive duration.
  Sound::StreamPtr envelope(const RenderConfig &config,
                            double noteDuration) const;

  // Zero when the note is too short to sustain.
  double getSustainTime(double noteDuration) const {
    double sustain = noteDuration - this->attack - this->decay - this->release;
    return sustain > 0.0 ? sustain : 0.0;
  }

  nlohmann::json toJson() const {
    return {{"attack", attack},
            {"decay", decay},
            {"release", release},
            {"sustainLevel", sustain_level}};
  }

  static std::optional<ADSR> fromJson(const nlohmann::json &j) {
    if (!j.contains("attack") || !j.contains("decay") ||
        !j.contains("release") || !j.contains("sustainLevel"))
      return std::nullopt;

    if (!j["attack"].is_number() || !j["decay"].is_number() ||
        !j["release"].is_number() || !j["sustainLevel"].is_number())
      return std::nullopt;

    ADSR adsr(j["attack"].get<double>(), j["decay"].get<double>(),
              j["release"].get<double>(), j["sustainLevel"].get<double>());

    if (adsr.attack <= 0.0 || adsr.decay <= 0.0 || adsr.release <= 0.0 ||
        adsr.sustain_level < 0.0 || adsr.sustain_level > 1.0)
      return std::nullopt;

    return adsr;
  }

  double attack = 0.01;
  double decay = 0.05;
  double release = 0.05;
  double sustain_level = 0.8;
};

#endif
