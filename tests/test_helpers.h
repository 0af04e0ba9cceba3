#pragma once

#include <gtest/gtest.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "sound.hpp"

namespace test_helpers {

/// @brief Pull a finite stream to its end.
inline std::vector<Sound::Sample> drain(Sound::SampleStream& stream) {
  std::vector<Sound::Sample> samples;
  while (auto sample = stream.next()) samples.push_back(*sample);
  return samples;
}

/// @brief Pull exactly count samples; fails the test if the stream ends first.
inline std::vector<Sound::Sample> take(Sound::SampleStream& stream, size_t count) {
  std::vector<Sound::Sample> samples;
  for (size_t i = 0; i < count; ++i) {
    auto sample = stream.next();
    EXPECT_TRUE(sample.has_value()) << "stream ended after " << i << " samples";
    if (!sample) break;
    samples.push_back(*sample);
  }
  return samples;
}

/// @brief Path in the temp directory unique to the running test.
inline std::string tempPath(const std::string& suffix) {
  const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
  std::string name = std::string("wavesynth_") + info->test_suite_name() + "_" +
                     info->name() + suffix;
  return (std::filesystem::temp_directory_path() / name).string();
}

}  // namespace test_helpers
