#include <cstdio>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "wlmerge/error_log.hpp"
#include "wlmerge/errors.hpp"
#include "wlmerge/merge_config.hpp"
#include "wlmerge/merge_engine.hpp"
#include "wlmerge/progress_state.hpp"
#include "wlmerge/shutdown.hpp"
#include "wlmerge/timing.hpp"

using namespace wlmerge;

namespace {

constexpr int EXIT_USAGE = 2;
constexpr int EXIT_INTERRUPTED = 130;

struct RunArgs {
  std::optional<std::string> wordlists_file;
  std::optional<std::string> rules_file;
  std::optional<std::string> config;
  std::optional<std::string> output_wordlist;
  std::optional<std::string> output_rules;
  std::optional<std::string> progress_file;
  std::optional<int> threads;
  std::string encoding = "auto";
  std::string error_log = "error.log";
  std::string timing_log;
  bool verbose = false;
  bool debug = false;
};

}  // namespace

static void usage_and_exit(const char* argv0) {
  std::fprintf(stderr,
               R"(Usage:
  %s merge [-w LIST | -r LIST | -c CONFIG] [--output-wordlist F | --output-rules F]
           [--progress-file F] [--threads N] [--encoding SPEC]
           [--error-log F] [--timing-log F] [-v] [-d]
  %s generate-config FILE [-t]
  %s guided-setup FILE
  %s resume CHECKPOINT [--encoding SPEC] [--error-log F] [--timing-log F] [-v] [-d]

Description:
  Merges every file named in LIST (one path per line, plain or .gz) into one
  deduplicated UTF-8 output. Each input's encoding is detected separately.
  Progress is checkpointed after every file (default <output>.checkpoint.json);
  after Ctrl-C the partial output and checkpoint are written and the run can
  be continued with `resume`.

  --encoding auto | force:<name> | sequence[:a,b,...]   (default: auto)

Example:
  %s merge -w /tmp/wordlists_to_merge.txt \
     --output-wordlist /tmp/merged_wordlist.txt \
     --threads 16 -v
)",
               argv0, argv0, argv0, argv0, argv0);
  std::exit(EXIT_USAGE);
}

static int parse_threads(const char* argv0, const std::string& s) {
  char* end = nullptr;
  const long n = std::strtol(s.c_str(), &end, 10);
  if (s.empty() || *end != '\0' || n < 0 || n > 1000000) {
    std::fprintf(stderr, "Bad --threads value: %s\n", s.c_str());
    usage_and_exit(argv0);
  }
  return static_cast<int>(n);
}

// Shared by merge and resume; `first` is the first argument after the
// subcommand (and its positional, if any).
static RunArgs parse_run_args(int argc, char** argv, int first,
                              bool allow_inputs) {
  RunArgs a;
  for (int i = first; i < argc; ++i) {
    std::string s = argv[i];
    const bool has_value = i + 1 < argc;
    if (allow_inputs && (s == "-w" || s == "--wordlists-file") && has_value) {
      a.wordlists_file = argv[++i];
    } else if (allow_inputs && (s == "-r" || s == "--rules-file") &&
               has_value) {
      a.rules_file = argv[++i];
    } else if (allow_inputs && (s == "-c" || s == "--config") && has_value) {
      a.config = argv[++i];
    } else if (allow_inputs && s == "--output-wordlist" && has_value) {
      a.output_wordlist = argv[++i];
    } else if (allow_inputs && s == "--output-rules" && has_value) {
      a.output_rules = argv[++i];
    } else if (allow_inputs && s == "--progress-file" && has_value) {
      a.progress_file = argv[++i];
    } else if (allow_inputs && s == "--threads" && has_value) {
      a.threads = parse_threads(argv[0], argv[++i]);
    } else if (s == "--encoding" && has_value) {
      a.encoding = argv[++i];
    } else if (s == "--error-log" && has_value) {
      a.error_log = argv[++i];
    } else if (s == "--timing-log" && has_value) {
      a.timing_log = argv[++i];
    } else if (s == "-v" || s == "--verbose") {
      a.verbose = true;
    } else if (s == "-d" || s == "--debug") {
      a.debug = true;
    } else if (s == "--help" || s == "-h") {
      usage_and_exit(argv[0]);
    } else {
      std::fprintf(stderr, "Unknown or incomplete arg: %s\n", s.c_str());
      usage_and_exit(argv[0]);
    }
  }
  return a;
}

static std::vector<std::string> collect_args(int argc, char** argv) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
  return args;
}

static int run_engine(Checkpoint& checkpoint, const RunArgs& args,
                      MergeOptions options, int argc, char** argv) {
  options.strategy = EncodingStrategy::Parse(args.encoding);

  ErrorLog error_log(args.error_log);
  ShutdownFlag flag;
  ShutdownCoordinator coordinator(checkpoint, flag);

  MergeSummary summary;
  EncodingStats stats;
  {
    // Installed before the engine starts any thread.
    SignalWatcher watcher(coordinator);
    MergeEngine engine(checkpoint, flag, error_log, std::move(options));
    summary = engine.Run();
    stats = engine.encoding_stats();
  }
  coordinator.MarkStopped();

  std::cerr << "[done] files=" << summary.files_processed << "/"
            << summary.files_total << " skipped=" << summary.files_skipped
            << " already_done=" << summary.files_already_done
            << " lines=" << summary.lines_read
            << " unique=" << summary.unique_lines
            << " batches=" << summary.batches
            << " errors=" << error_log.count() << "\n";
  if (args.verbose) std::cerr << stats.Summary();

  if (!args.timing_log.empty()) {
    WriteTimingReport(args.timing_log, argv[0], collect_args(argc, argv),
                      RunCounters{
                          {"files_total", summary.files_total},
                          {"files_processed", summary.files_processed},
                          {"files_skipped", summary.files_skipped},
                          {"files_already_done", summary.files_already_done},
                          {"lines_read", summary.lines_read},
                          {"unique_lines", summary.unique_lines},
                          {"batches", summary.batches},
                          {"bytes_decoded", stats.bytes_processed()},
                          {"replacement_chars", stats.conversion_errors()},
                      });
  }

  if (summary.interrupted) {
    std::cerr << "[shutdown] interrupted; continue with: " << argv[0]
              << " resume " << checkpoint.save_path() << "\n";
    return EXIT_INTERRUPTED;
  }
  return 0;
}

static int cmd_merge(int argc, char** argv) {
  RunArgs args = parse_run_args(argc, argv, 2, /*allow_inputs=*/true);

  MergeConfig cfg;
  if (args.config) {
    cfg = LoadConfig(*args.config);
  } else {
    cfg.verbose = false;
    cfg.debug = false;
  }

  std::optional<std::string> input = args.wordlists_file;
  if (!input) input = args.rules_file;
  if (!input) input = cfg.input_files;
  std::optional<std::string> output = args.output_wordlist;
  if (!output) output = args.output_rules;
  if (!output) output = cfg.output_files;

  if (!input) {
    std::fprintf(stderr,
                 "No input file specified (use -w, -r or a config file)\n");
    usage_and_exit(argv[0]);
  }
  if (!output) {
    std::fprintf(stderr,
                 "No output file specified (use --output-wordlist, "
                 "--output-rules or a config file)\n");
    usage_and_exit(argv[0]);
  }

  cfg.input_files = input;
  cfg.output_files = output;
  if (args.threads) cfg.threads = args.threads;
  args.verbose = args.verbose || cfg.verbose;
  args.debug = args.debug || cfg.debug;
  ValidateConfig(cfg);

  ProgressState state;
  state.input_file = *input;
  state.output_file = *output;
  state.thread_count =
      static_cast<std::size_t>(cfg.threads.value_or(DEFAULT_CONFIG_THREADS));
  state.save_path = args.progress_file.value_or(DefaultCheckpointPath(*output));

  Checkpoint checkpoint(std::move(state));
  checkpoint.Save();

  MergeOptions options;
  options.verbose = args.verbose;
  options.debug = args.debug;
  return run_engine(checkpoint, args, std::move(options), argc, argv);
}

static int cmd_resume(int argc, char** argv) {
  if (argc < 3) usage_and_exit(argv[0]);
  RunArgs args = parse_run_args(argc, argv, 3, /*allow_inputs=*/false);

  Checkpoint checkpoint = Checkpoint::Load(argv[2]);
  std::cerr << "[checkpoint] resuming " << checkpoint.save_path() << ": "
            << checkpoint.processed_count() << " files done, position "
            << checkpoint.current_position() << "\n";

  MergeOptions options;
  options.resume = true;
  options.verbose = args.verbose;
  options.debug = args.debug;
  return run_engine(checkpoint, args, std::move(options), argc, argv);
}

static int cmd_generate_config(int argc, char** argv) {
  if (argc < 3) usage_and_exit(argv[0]);
  for (int i = 3; i < argc; ++i) {
    std::string s = argv[i];
    if (s != "-t" && s != "--template") {
      std::fprintf(stderr, "Unknown arg: %s\n", s.c_str());
      usage_and_exit(argv[0]);
    }
  }
  SaveConfig(ConfigTemplate(), argv[2]);
  std::cerr << "[cfg] configuration template written to " << argv[2] << "\n";
  return 0;
}

static int cmd_guided_setup(int argc, char** argv) {
  if (argc != 3) usage_and_exit(argv[0]);
  const MergeConfig cfg = GuidedSetup(std::cin, std::cout);
  SaveConfig(cfg, argv[2]);
  std::cerr << "[cfg] configuration saved to " << argv[2] << "\n";
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 2) usage_and_exit(argv[0]);
  const std::string cmd = argv[1];

  try {
    if (cmd == "merge") return cmd_merge(argc, argv);
    if (cmd == "resume") return cmd_resume(argc, argv);
    if (cmd == "generate-config") return cmd_generate_config(argc, argv);
    if (cmd == "guided-setup") return cmd_guided_setup(argc, argv);
    if (cmd == "--help" || cmd == "-h") usage_and_exit(argv[0]);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "FATAL: %s\n", e.what());
    return 1;
  }

  std::fprintf(stderr, "Unknown command: %s\n", cmd.c_str());
  usage_and_exit(argv[0]);
  return EXIT_USAGE;
}
