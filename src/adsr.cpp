#include "adsr.hpp"

#include <cmath>
#include <string>

Sound::StreamPtr Sound::linearAdsr(const RenderConfig &config, double attack,
                                   double decay, double sustain,
                                   double release, double sustainLevel) {
  if (!(sustainLevel >= 0.0 && sustainLevel <= 1.0))
    throw InvalidParameterError("Sustain level must be within [0, 1], got " +
                                std::to_string(sustainLevel));

  return concatenate(
      linearChange(config, attack, 0.0, 1.0),
      linearChange(config, decay, 1.0, sustainLevel),
      timeLimit(config, hold(sustainLevel), sustain),
      linearChange(config, release, sustainLevel, 0.0));
}

Sound::StreamPtr ADSR::envelope(const RenderConfig &config,
                                double noteDuration) const {
  if (!std::isfinite(noteDuration) || noteDuration <= 0.0)
    throw InvalidParameterError("Note duration must be positive, got " +
                                std::to_string(noteDuration));
  if (!(this->sustain_level >= 0.0 && this->sustain_level <= 1.0))
    throw InvalidParameterError("Sustain level must be within [0, 1], got " +
                                std::to_string(this->sustain_level));

  double sustain = this->getSustainTime(noteDuration);
  if (sustain > 0.0)
    return Sound::linearAdsr(config, this->attack, this->decay, sustain,
                             this->release, this->sustain_level);

  double factor = noteDuration / (this->attack + this->decay + this->release);
  return Sound::concatenate(
      Sound::linearChange(config, this->attack * factor, 0.0, 1.0),
      Sound::linearChange(config, this->decay * factor, 1.0,
                          this->sustain_level),
      Sound::linearChange(config, this->release * factor,
                          this->sustain_level, 0.0));
}
