#include "config.hpp"

#include <cstdint>
#include <fstream>
#include <limits>

namespace {

// Integer field at full width, so oversized values cannot wrap into range.
std::optional<std::int64_t> readInteger(const nlohmann::json &value) {
  if (value.is_number_unsigned()) {
    auto u = value.get<std::uint64_t>();
    if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
      return std::nullopt;
    return static_cast<std::int64_t>(u);
  }
  if (value.is_number_integer())
    return value.get<std::int64_t>();
  return std::nullopt;
}

} // namespace

std::optional<RenderConfig> RenderConfig::fromJson(const nlohmann::json &j) {
  if (!j.is_object())
    return std::nullopt;

  int sampleRate = DEFAULT_SAMPLE_RATE;
  double tempo = DEFAULT_TEMPO;

  if (j.contains("sampleRate")) {
    auto value = readInteger(j["sampleRate"]);
    if (!value || *value < 1 || *value > std::numeric_limits<int>::max())
      return std::nullopt;
    sampleRate = static_cast<int>(*value);
  }
  if (j.contains("tempo")) {
    if (!j["tempo"].is_number())
      return std::nullopt;
    tempo = j["tempo"].get<double>();
  }

  // Only mono 16-bit output exists; anything else in a document is an error
  // rather than something to quietly ignore.
  if (j.contains("channels") && readInteger(j["channels"]) != 1)
    return std::nullopt;
  if (j.contains("bitsPerSample") && readInteger(j["bitsPerSample"]) != 16)
    return std::nullopt;

  if (!(tempo > 0.0))
    return std::nullopt;

  return RenderConfig(sampleRate, tempo);
}

std::optional<RenderConfig> RenderConfig::load(const std::string &file) {
  std::ifstream in(file);
  if (!in.is_open())
    return std::nullopt;

  nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
  if (j.is_discarded())
    return std::nullopt;

  return fromJson(j);
}
