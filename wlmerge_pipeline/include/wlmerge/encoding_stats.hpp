#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace wlmerge {

// Per-run encoding counters for the end-of-run summary.
// Not synchronized: each worker fills its own copy and the engine merges
// them under a lock.
class EncodingStats {
 public:
  void RecordFileProcessed() { ++files_processed_; }
  void RecordDetected(const std::string& encoding) { ++detected_[encoding]; }
  void RecordForced(const std::string& encoding) { ++forced_[encoding]; }
  void RecordFallback(const std::string& encoding) { ++fallback_[encoding]; }
  void RecordBytes(std::uint64_t n) { bytes_processed_ += n; }
  void AddElapsed(std::chrono::steady_clock::duration d) { elapsed_ += d; }

  void Merge(const EncodingStats& other);

  // Encoding chosen most often across detected/forced/fallback. Empty if
  // nothing was recorded; ties resolve to the alphabetically first name.
  std::string MostCommonEncoding() const;

  // Percent of files that went through without a single replacement char.
  double SuccessRate() const;

  std::string Summary() const;

  std::uint64_t files_processed() const { return files_processed_; }
  std::uint64_t files_with_errors() const { return files_with_errors_; }
  std::uint64_t conversion_errors() const { return conversion_errors_; }
  std::uint64_t bytes_processed() const { return bytes_processed_; }
  std::chrono::steady_clock::duration elapsed() const { return elapsed_; }
  const std::map<std::string, std::uint64_t>& detected() const {
    return detected_;
  }
  const std::map<std::string, std::uint64_t>& forced() const { return forced_; }
  const std::map<std::string, std::uint64_t>& fallback() const {
    return fallback_;
  }

  // One file finished converting with `replacements` U+FFFD substitutions.
  void RecordFileConversion(std::uint64_t replacements) {
    conversion_errors_ += replacements;
    if (replacements > 0) ++files_with_errors_;
  }

 private:
  std::uint64_t files_processed_ = 0;
  std::uint64_t files_with_errors_ = 0;
  std::uint64_t conversion_errors_ = 0;
  std::uint64_t bytes_processed_ = 0;
  std::chrono::steady_clock::duration elapsed_{};
  std::map<std::string, std::uint64_t> detected_;
  std::map<std::string, std::uint64_t> forced_;
  std::map<std::string, std::uint64_t> fallback_;
};

// Decimal units: "0 B", "512 B", "1.0 KB", "1.0 MB", "1.1 GB".
std::string FormatBytes(std::uint64_t bytes);

}  // namespace wlmerge
