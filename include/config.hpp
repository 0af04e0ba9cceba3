// config.hpp
#ifndef WAVESYNTH_CONFIG_HPP
#define WAVESYNTH_CONFIG_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "errors.hpp"

// Render-wide constants. Built once and handed by reference to every stream
// constructor and to the renderer; there are no setters.
class RenderConfig {
public:
  static constexpr int DEFAULT_SAMPLE_RATE = 44100;
  static constexpr double DEFAULT_TEMPO = 120.0;

  explicit RenderConfig(int sampleRate = DEFAULT_SAMPLE_RATE,
                        double tempo = DEFAULT_TEMPO)
      : sampleRate_(sampleRate), tempo_(tempo) {
    if (sampleRate <= 0)
      throw InvalidParameterError("Sample rate must be positive, got " +
                                  std::to_string(sampleRate));
    if (!(tempo > 0.0))
      throw InvalidParameterError("Tempo must be positive, got " +
                                  std::to_string(tempo));
  }

  // ---- SampleRate ----
  int getSampleRate() const { return sampleRate_; }

  // ---- Tempo (quarter notes per minute) ----
  double getTempo() const { return tempo_; }

  // The container is always mono 16-bit PCM.
  int getChannels() const { return 1; }
  int getBitsPerSample() const { return 16; }

  // Copy with another tempo, used when the command line overrides a document.
  RenderConfig withTempo(double tempo) const {
    return RenderConfig(sampleRate_, tempo);
  }

  nlohmann::json toJson() const {
    return {{"sampleRate", sampleRate_},
            {"tempo", tempo_},
            {"channels", getChannels()},
            {"bitsPerSample", getBitsPerSample()}};
  }

  static std::optional<RenderConfig> fromJson(const nlohmann::json &j);
  static std::optional<RenderConfig> load(const std::string &file);

private:
  int sampleRate_;
  double tempo_;
};

#endif
