#include "wlmerge/merge_config.hpp"

#include <unistd.h>

#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>

#include "wlmerge/errors.hpp"
#include "wlmerge/text_utils.hpp"

namespace wlmerge {

using nlohmann::json;
namespace fs = std::filesystem;

namespace {

template <typename T>
std::optional<T> OptionalField(const json& j, const char* key) {
  if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
  return j.at(key).get<T>();
}

std::string Prompt(std::istream& in, std::ostream& out,
                   const std::string& question, const std::string& def) {
  out << question << " [" << def << "]: " << std::flush;
  std::string line;
  if (!std::getline(in, line)) return def;
  const std::string_view answer = TrimAscii(line);
  return answer.empty() ? def : std::string(answer);
}

bool Confirm(std::istream& in, std::ostream& out, const std::string& question,
             bool def) {
  while (true) {
    const std::string answer =
        Prompt(in, out, question + " (y/n)", def ? "y" : "n");
    if (answer.empty()) return def;
    const char c = static_cast<char>(
        std::tolower(static_cast<unsigned char>(answer.front())));
    if (c == 'y') return true;
    if (c == 'n') return false;
    out << "Please answer y or n.\n";
    if (!in) return def;
  }
}

}  // namespace

json ConfigToJson(const MergeConfig& cfg) {
  json j;
  j["input_files"] = cfg.input_files ? json(*cfg.input_files) : json(nullptr);
  j["output_files"] =
      cfg.output_files ? json(*cfg.output_files) : json(nullptr);
  j["threads"] = cfg.threads ? json(*cfg.threads) : json(nullptr);
  j["verbose"] = cfg.verbose;
  j["debug"] = cfg.debug;
  return j;
}

MergeConfig ConfigFromJson(const json& j) {
  if (!j.is_object()) throw ConfigError("configuration must be a JSON object");
  MergeConfig cfg;
  try {
    cfg.input_files = OptionalField<std::string>(j, "input_files");
    cfg.output_files = OptionalField<std::string>(j, "output_files");
    if (auto t = OptionalField<int>(j, "threads")) cfg.threads = *t;
    if (auto v = OptionalField<bool>(j, "verbose")) cfg.verbose = *v;
    if (auto d = OptionalField<bool>(j, "debug")) cfg.debug = *d;
  } catch (const json::exception& e) {
    throw ConfigError(std::string("invalid format: ") + e.what());
  }
  return cfg;
}

MergeConfig LoadConfig(const std::string& path) {
  std::ifstream in(path);
  if (!in) throw IoError("cannot read config " + path);
  json j;
  try {
    in >> j;
  } catch (const json::parse_error& e) {
    throw ConfigError("invalid format in " + path + ": " + e.what());
  }
  return ConfigFromJson(j);
}

void SaveConfig(const MergeConfig& cfg, const std::string& path) {
  std::ofstream out(path, std::ios::out | std::ios::trunc);
  if (!out) throw IoError("cannot write config " + path);
  out << ConfigToJson(cfg).dump(2) << "\n";
  if (!out) throw IoError("write failed for config " + path);
}

MergeConfig ConfigTemplate() { return MergeConfig{}; }

void ValidateConfig(const MergeConfig& cfg) {
  if (cfg.threads && (*cfg.threads < MIN_THREADS || *cfg.threads > MAX_THREADS)) {
    throw ConfigError("invalid thread count " + std::to_string(*cfg.threads) +
                      " (must be " + std::to_string(MIN_THREADS) + "-" +
                      std::to_string(MAX_THREADS) + ")");
  }

  if (!cfg.input_files || cfg.input_files->empty()) {
    throw ConfigError("no input file specified");
  }
  const fs::path input(*cfg.input_files);
  std::error_code ec;
  if (!fs::is_regular_file(input, ec)) {
    throw ConfigError("input file does not exist: " + input.string());
  }

  if (!cfg.output_files || cfg.output_files->empty()) {
    throw ConfigError("no output file specified");
  }
  const fs::path output(*cfg.output_files);
  std::error_code in_ec, out_ec;
  const fs::path input_abs = fs::weakly_canonical(input, in_ec);
  const fs::path output_abs = fs::weakly_canonical(output, out_ec);
  if (input == output || (!in_ec && !out_ec && input_abs == output_abs)) {
    throw ConfigError("input and output are the same file: " + input.string());
  }

  fs::path dir = output.parent_path();
  if (dir.empty()) dir = ".";
  if (!fs::is_directory(dir, ec)) {
    throw ConfigError("output directory does not exist: " + dir.string());
  }

  const fs::path probe =
      dir / (".wlmerge_write_test_" + std::to_string(::getpid()));
  {
    std::ofstream test(probe);
    if (!test) {
      throw ConfigError("output directory is not writable: " + dir.string());
    }
  }
  fs::remove(probe, ec);
}

MergeConfig GuidedSetup(std::istream& in, std::ostream& out) {
  MergeConfig cfg;
  cfg.input_files = Prompt(in, out, "Enter path to input files list",
                           "/tmp/wordlists_to_merge.txt");
  cfg.output_files = Prompt(in, out, "Enter path for output file",
                            "/tmp/merged_wordlist.txt");
  const std::string threads = Prompt(in, out, "Enter number of threads", "50");
  cfg.verbose = Confirm(in, out, "Enable verbose logging?", true);
  cfg.debug = Confirm(in, out, "Enable debug logging?", false);

  int n = 0;
  std::size_t used = 0;
  try {
    n = std::stoi(threads, &used);
  } catch (const std::logic_error&) {
    throw ConfigError("invalid thread count '" + threads + "'");
  }
  if (used != threads.size() || n < MIN_THREADS || n > MAX_THREADS) {
    throw ConfigError("invalid thread count '" + threads + "' (must be " +
                      std::to_string(MIN_THREADS) + "-" +
                      std::to_string(MAX_THREADS) + ")");
  }
  cfg.threads = n;
  return cfg;
}

}  // namespace wlmerge
