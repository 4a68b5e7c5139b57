#pragma once

#include <iosfwd>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace wlmerge {

static constexpr int MIN_THREADS = 1;
static constexpr int MAX_THREADS = 100;
static constexpr int DEFAULT_CONFIG_THREADS = 10;

struct MergeConfig {
  // Path of the file listing input wordlists, one per line.
  std::optional<std::string> input_files;
  // Path of the merged output.
  std::optional<std::string> output_files;
  std::optional<int> threads = DEFAULT_CONFIG_THREADS;
  bool verbose = true;
  bool debug = true;
};

nlohmann::json ConfigToJson(const MergeConfig& cfg);

// Missing keys and nulls keep the defaults. Throws ConfigError on wrong
// types.
MergeConfig ConfigFromJson(const nlohmann::json& j);

// Throws IoError if unreadable, ConfigError if not valid JSON.
MergeConfig LoadConfig(const std::string& path);

// Pretty JSON, 2-space indent. Throws IoError.
void SaveConfig(const MergeConfig& cfg, const std::string& path);

MergeConfig ConfigTemplate();

// In order: thread count range, input present, input exists, output
// present, input != output, output directory exists and is writable.
// Throws ConfigError naming the first failure.
void ValidateConfig(const MergeConfig& cfg);

// Interactive prompts on `in`/`out` with defaults
//   /tmp/wordlists_to_merge.txt, /tmp/merged_wordlist.txt, 50, yes, no.
// Throws ConfigError for a thread count that is not a number in 1..100.
MergeConfig GuidedSetup(std::istream& in, std::ostream& out);

}  // namespace wlmerge
