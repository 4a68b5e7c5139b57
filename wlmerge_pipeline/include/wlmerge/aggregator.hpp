#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <string>
#include <thread>
#include <unordered_set>

#include "wlmerge/bounded_channel.hpp"

namespace wlmerge {

class ShutdownFlag;

// Unique trimmed lines from one worker, at most the batch capacity.
using LineBatch = std::unordered_set<std::string>;
// Every unique line of the run. Only the aggregator thread mutates it.
using DedupSet = std::unordered_set<std::string>;

static constexpr std::size_t WRITE_CHUNK_SIZE = 10 * 1024 * 1024;

// Single consumer of the batch channel.
//
// Start() launches the consumer thread; it merges each received batch into
// the dedup set until the channel is closed and drained. Finish() joins and
// hands the set over. If merging throws, the channel is closed so producers
// fail fast with ChannelError, and Finish() rethrows the original error.
class Aggregator {
 public:
  using MergeHook = std::function<void(std::uint64_t unique)>;

  Aggregator(BoundedChannel<LineBatch>& channel, DedupSet seed,
             const ShutdownFlag* flag, bool debug, MergeHook on_merge = {});
  ~Aggregator();

  Aggregator(const Aggregator&) = delete;
  Aggregator& operator=(const Aggregator&) = delete;

  void Start();
  DedupSet Finish();

  // Published after every merge.
  std::uint64_t unique_count() const { return unique_count_.load(); }
  std::uint64_t lines_received() const { return lines_received_.load(); }
  std::uint64_t batches_merged() const { return batches_merged_.load(); }

 private:
  void Run();

  BoundedChannel<LineBatch>& channel_;
  DedupSet set_;
  const ShutdownFlag* flag_;
  bool debug_;
  MergeHook on_merge_;

  std::thread thread_;
  std::exception_ptr error_;

  std::atomic<std::uint64_t> unique_count_{0};
  std::atomic<std::uint64_t> lines_received_{0};
  std::atomic<std::uint64_t> batches_merged_{0};
};

// Write one line per entry to `<output>.tmp`, flushing every `chunk_bytes`,
// then rename over `output`. Returns lines written. Throws IoError.
std::uint64_t WriteUniqueLines(const DedupSet& lines, const std::string& output,
                               std::size_t chunk_bytes = WRITE_CHUNK_SIZE);

// Add the lines of an earlier partial output to `set`. A missing file adds
// nothing. Returns the number of lines inserted. Throws IoError.
std::uint64_t SeedFromFile(const std::string& path, DedupSet& set);

}  // namespace wlmerge
