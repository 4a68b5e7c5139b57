// wlmerge_pipeline/include/wlmerge/progress_state.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace wlmerge {

static constexpr std::size_t DEFAULT_THREADS = 10;

struct ProgressState {
  std::string input_file;
  std::string output_file;
  std::size_t thread_count = DEFAULT_THREADS;
  // Only fully ingested files, in completion order.
  std::vector<std::string> processed_files;
  // Non-empty lines read from processed_files.
  std::uint64_t current_position = 0;
  // Leading processed_files whose lines are in output_file, and their line
  // count. Advanced only after the output has been written and renamed.
  std::size_t committed_files = 0;
  std::uint64_t committed_position = 0;
  std::string save_path;
};

nlohmann::json ProgressToJson(const ProgressState& state);

// Throws nlohmann::json::exception on missing keys or wrong types.
// "threads" is accepted in place of "thread_count". Without the committed_*
// keys every processed file counts as committed.
ProgressState ProgressFromJson(const nlohmann::json& j);

// "<output>.checkpoint.json"
std::string DefaultCheckpointPath(const std::string& output_file);

// Run-wide holder of ProgressState, shared by reference with every worker.
//
// Reads and mutations go through one reader/writer lock held only for the
// copy or update itself. Save() serializes a snapshot and writes it to
// save_path atomically (temp file + rename); a separate save mutex keeps
// concurrent saves from interleaving, so the file on disk always reflects
// the newest snapshot written last.
class Checkpoint {
 public:
  explicit Checkpoint(ProgressState state);

  Checkpoint(const Checkpoint&) = delete;
  Checkpoint& operator=(const Checkpoint&) = delete;

  // Re-attaches `path` as save_path. Throws ResumeError if the file is
  // missing or cannot be parsed.
  static Checkpoint Load(const std::string& path);

  // No-op when save_path is empty. Throws IoError.
  void Save() const;

  // Append `path`, add `lines` to current_position, then Save().
  void RecordFileCompleted(const std::string& path, std::uint64_t lines);

  // Everything recorded so far is now in the output file. Does not save.
  void MarkOutputCommitted();

  // Forget files recorded after the last commit so they are ingested again.
  // Returns how many were dropped.
  std::size_t RollbackUncommitted();

  bool IsProcessed(const std::string& path) const;

  ProgressState Snapshot() const;
  std::uint64_t current_position() const;
  std::size_t processed_count() const;
  std::string save_path() const;

 private:
  mutable std::shared_mutex mu_;
  mutable std::mutex save_mu_;
  ProgressState state_;
  std::unordered_set<std::string> processed_index_;
};

}  // namespace wlmerge
