#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "wlmerge/aggregator.hpp"
#include "wlmerge/batch_sizer.hpp"
#include "wlmerge/encoding.hpp"
#include "wlmerge/encoding_stats.hpp"
#include "wlmerge/input_files.hpp"

namespace wlmerge {

class Checkpoint;
class ErrorLog;
class ShutdownFlag;
struct ProgressState;

static constexpr std::size_t DEFAULT_CHANNEL_CAPACITY = 16;

struct MergeOptions {
  EncodingStrategy strategy = EncodingStrategy::AutoDetect();
  // 0 = thread_count from the checkpoint.
  std::size_t threads = 0;
  // 0 = ComputeBatchCapacity(meminfo_path).
  std::size_t batch_capacity = 0;
  std::size_t channel_capacity = DEFAULT_CHANNEL_CAPACITY;
  std::size_t batch_byte_threshold = CHUNK_SIZE;
  std::size_t write_chunk_bytes = WRITE_CHUNK_SIZE;
  std::string meminfo_path = DEFAULT_MEMINFO_PATH;
  // Continue a checkpoint: check it against the input list, re-queue files
  // recorded after the last output write, and seed the dedup set from the
  // existing output.
  bool resume = false;
  bool verbose = false;
  bool debug = false;
  // Called from the worker thread after a file is recorded as processed.
  std::function<void(const std::string& path, std::uint64_t lines)>
      on_file_done;
  // Called from the aggregator thread after each merged batch with the unique
  // line count. An exception thrown here fails the aggregator.
  std::function<void(std::uint64_t unique)> on_batch_merged;
};

struct MergeSummary {
  std::uint64_t files_total = 0;
  std::uint64_t files_processed = 0;
  std::uint64_t files_skipped = 0;
  std::uint64_t files_already_done = 0;
  std::uint64_t lines_read = 0;
  std::uint64_t unique_lines = 0;
  std::uint64_t batches = 0;
  bool interrupted = false;
};

// Throws ResumeError if `state` has no output path, lists a processed file
// that `input_paths` no longer contains, or claims committed files while the
// output file is gone.
void ValidateResume(const ProgressState& state,
                    const std::vector<std::string>& input_paths);

// One merge run over the input list named in the checkpoint.
//
// Run() reads the list, drops files the checkpoint already records, orders
// the rest, then fans them out to a fixed pool of workers feeding one
// Aggregator through a bounded channel. When the workers stop (all files
// done, or the shutdown flag was raised) the dedup set is written to the
// output, the checkpoint marked committed and saved. Per-file failures are
// logged and skipped; channel, aggregator and output-write failures are
// rethrown after the checkpoint is saved without advancing the commit.
class MergeEngine {
 public:
  MergeEngine(Checkpoint& checkpoint, ShutdownFlag& flag, ErrorLog& error_log,
              MergeOptions options);

  MergeSummary Run();

  // Valid after Run().
  const EncodingStats& encoding_stats() const { return stats_; }

 private:
  // Stream one file into batches. Returns its non-empty line count.
  std::uint64_t IngestFile(const FileDescriptor& file,
                           BoundedChannel<LineBatch>& channel,
                           std::size_t capacity, EncodingStats& stats,
                           std::uint64_t& batches);

  void WorkerLoop(const std::vector<FileDescriptor>& files,
                  BoundedChannel<LineBatch>& channel, std::size_t capacity,
                  const Aggregator& aggregator);

  void SaveCheckpointLogged();

  Checkpoint& checkpoint_;
  ShutdownFlag& flag_;
  ErrorLog& error_log_;
  MergeOptions options_;

  std::atomic<std::size_t> cursor_{0};
  std::atomic<bool> fatal_{false};
  std::atomic<std::uint64_t> files_processed_{0};
  std::atomic<std::uint64_t> files_skipped_{0};
  std::atomic<std::uint64_t> lines_read_{0};
  std::atomic<std::uint64_t> batches_{0};

  std::mutex mu_;
  std::exception_ptr worker_error_;
  EncodingStats stats_;
};

}  // namespace wlmerge
