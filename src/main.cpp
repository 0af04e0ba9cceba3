#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#include <stdio.h>

#include "config.hpp"
#include "errors.hpp"
#include "score.hpp"
#include "wave.hpp"

void usage(char *argv0) {
  printf("Usage: %s --score [file] [flags]\n", argv0);
  printf("       %s --info [file.wav]\n", argv0);
  printf("flags:\n");
  printf("   --score [file]: JSON score to render (required)\n");
  printf("   --output [file]: Wave file to write, default: out.wav\n");
  printf("   --config [file]: JSON render configuration, overrides the one in "
         "the score\n");
  printf("   --tempo [float]: Quarter notes per minute, overrides any "
         "configuration\n");
  printf("   --tuning [equal|werckmeister3]: Tuning system, overrides the "
         "score's\n");
  printf("   --info [file]: Print the header of a wave file and exit\n");
}

struct Options {
  std::string scoreFile;
  std::string output = "out.wav";
  std::string configFile;
  std::string infoFile;
  std::optional<double> tempo;
  std::optional<notes::TuningSystem> tuning;
};

std::optional<Options> parseArgs(int argc, char *argv[]) {
  Options options;

  for (int i = 1; i < argc; i += 2) {
    std::string arg = argv[i];

    if (arg == "--score" && i + 1 < argc) {
      options.scoreFile = argv[i + 1];
    } else if (arg == "--output" && i + 1 < argc) {
      options.output = argv[i + 1];
    } else if (arg == "--config" && i + 1 < argc) {
      options.configFile = argv[i + 1];
    } else if (arg == "--info" && i + 1 < argc) {
      options.infoFile = argv[i + 1];
    } else if (arg == "--tempo" && i + 1 < argc) {
      options.tempo = std::stod(argv[i + 1]);
    } else if (arg == "--tuning" && i + 1 < argc) {
      std::string tuningArg = argv[i + 1];
      if (tuningArg == "equal") {
        options.tuning = notes::TuningSystem::EqualTemperament;
      } else if (tuningArg == "werckmeister3") {
        options.tuning = notes::TuningSystem::WerckmeisterIII;
      } else {
        std::cerr << "Unknown tuning: " << tuningArg
                  << " (expected equal or werckmeister3)\n";
        return std::nullopt;
      }
    } else {
      std::cerr << "Unknown or incomplete argument: " << arg << "\n"
                << std::endl;
      return std::nullopt;
    }
  }

  if (options.scoreFile.empty() && options.infoFile.empty()) {
    std::cerr << "Error: --score [file] is required!\n" << std::endl;
    return std::nullopt;
  }

  return options;
}

int printInfo(const std::string &file) {
  auto wave = Wave::read(file);
  if (!wave) {
    std::cerr << "Error: " << file << " is not a 16-bit PCM wave file"
              << std::endl;
    return 1;
  }
  printf("%s\n", file.c_str());
  printf("  channels:        %d\n", wave->channels);
  printf("  sample rate:     %d Hz\n", wave->sampleRate);
  printf("  bits per sample: %d\n", wave->bitsPerSample);
  printf("  frames:          %ld\n", wave->frames());
  if (wave->sampleRate > 0)
    printf("  duration:        %.3f s\n",
           static_cast<double>(wave->frames()) / wave->sampleRate);
  return 0;
}

int renderScore(const Options &options) {
  if (!std::filesystem::exists(options.scoreFile)) {
    std::cerr << "Error: Score file does not exist: " << options.scoreFile
              << std::endl;
    return 1;
  }

  std::ifstream in(options.scoreFile);
  nlohmann::json document = nlohmann::json::parse(in, nullptr, false);
  if (document.is_discarded()) {
    std::cerr << "Error: Failed to parse " << options.scoreFile << std::endl;
    return 1;
  }

  auto score = Score::fromJson(document);
  if (!score) {
    std::cerr << "Error: " << options.scoreFile << " is not a valid score"
              << std::endl;
    return 1;
  }
  if (options.tuning)
    score->tuning = *options.tuning;

  std::optional<RenderConfig> config = RenderConfig();
  if (!options.configFile.empty()) {
    config = RenderConfig::load(options.configFile);
    if (!config) {
      std::cerr << "Error: Invalid render configuration: "
                << options.configFile << std::endl;
      return 1;
    }
  } else if (document.contains("config")) {
    config = RenderConfig::fromJson(document["config"]);
    if (!config) {
      std::cerr << "Error: Invalid render configuration in "
                << options.scoreFile << std::endl;
      return 1;
    }
  }
  if (options.tempo)
    config = config->withTempo(*options.tempo);

  printf("Rendering %zu notes (%.2f s at %.1f bpm, %s) to %s\n",
         score->melody.size(), score->duration(*config), config->getTempo(),
         notes::tuningToString(score->tuning).c_str(), options.output.c_str());

  Sound::StreamPtr stream = score->toStream(*config);
  long frames = Wave::render(*stream, options.output, *config);

  printf("Wrote %ld frames at %d Hz\n", frames, config->getSampleRate());
  return 0;
}

int main(int argc, char *argv[]) {
  if (argc < 2) {
    usage(argv[0]);
    return 1;
  }
  if (std::string(argv[1]) == "--help") {
    usage(argv[0]);
    return 0;
  }

  try {
    std::optional<Options> options = parseArgs(argc, argv);
    if (!options) {
      usage(argv[0]);
      return 1;
    }
    if (!options->infoFile.empty())
      return printInfo(options->infoFile);
    return renderScore(*options);
  } catch (const RenderError &e) {
    std::cerr << "Error: render aborted: " << e.what() << std::endl;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
  }
  return 1;
}
