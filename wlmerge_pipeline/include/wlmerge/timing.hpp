#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace wlmerge {

struct TimingEntry {
  std::string name;
  std::chrono::steady_clock::duration duration;
};

class TimingRegistry {
 public:
  static TimingRegistry& Instance();

  void Add(std::string name, std::chrono::steady_clock::duration d);

  // Copy taken under the lock: workers may still be adding entries.
  std::vector<TimingEntry> Entries() const;

  void Clear();

 private:
  TimingRegistry() = default;

  mutable std::mutex mu_;
  std::vector<TimingEntry> entries_;
};

class ScopeTimer {
 public:
  explicit ScopeTimer(std::string name)
      : name_(std::move(name)),
        start_(std::chrono::steady_clock::now()) {}

  ~ScopeTimer() {
    const auto end = std::chrono::steady_clock::now();
    TimingRegistry::Instance().Add(name_, end - start_);
  }

 private:
  std::string name_;
  std::chrono::steady_clock::time_point start_;
};

#define WLMERGE_CONCAT_INNER(a, b) a##b
#define WLMERGE_CONCAT(a, b) WLMERGE_CONCAT_INNER(a, b)

/// WLMERGE_SCOPE_TIMER("stage") records the enclosing scope's wall time.
#define WLMERGE_SCOPE_TIMER(label) \
  ::wlmerge::ScopeTimer WLMERGE_CONCAT(wlmerge_scope_timer_, __LINE__)(label)

/// Named counters written after the stage rows as "#name value".
using RunCounters = std::vector<std::pair<std::string, std::uint64_t>>;

/// Append a timing block for the current run to a log file.
///
/// `append` defaults to true so consecutive merge/resume runs share one file.
void WriteTimingReport(const std::string& out_path,
                       const std::string& program_name,
                       const std::vector<std::string>& args,
                       const RunCounters& counters,
                       bool append = true);

}  // namespace wlmerge
