#include "wlmerge/encoding_stats.hpp"

#include <cstdio>
#include <sstream>

namespace wlmerge {

namespace {

void MergeCounts(std::map<std::string, std::uint64_t>& into,
                 const std::map<std::string, std::uint64_t>& from) {
  for (const auto& [name, n] : from) into[name] += n;
}

void AppendCounts(std::ostringstream& os, const char* label,
                  const std::map<std::string, std::uint64_t>& counts) {
  if (counts.empty()) return;
  os << "  " << label << ":\n";
  for (const auto& [name, n] : counts) {
    os << "    " << name << ": " << n << "\n";
  }
}

}  // namespace

void EncodingStats::Merge(const EncodingStats& other) {
  files_processed_ += other.files_processed_;
  files_with_errors_ += other.files_with_errors_;
  conversion_errors_ += other.conversion_errors_;
  bytes_processed_ += other.bytes_processed_;
  elapsed_ += other.elapsed_;
  MergeCounts(detected_, other.detected_);
  MergeCounts(forced_, other.forced_);
  MergeCounts(fallback_, other.fallback_);
}

std::string EncodingStats::MostCommonEncoding() const {
  std::map<std::string, std::uint64_t> all;
  MergeCounts(all, detected_);
  MergeCounts(all, forced_);
  MergeCounts(all, fallback_);

  std::string best;
  std::uint64_t best_n = 0;
  for (const auto& [name, n] : all) {
    if (n > best_n) {
      best = name;
      best_n = n;
    }
  }
  return best;
}

double EncodingStats::SuccessRate() const {
  if (files_processed_ == 0) return 100.0;
  const auto clean = files_processed_ - files_with_errors_;
  return 100.0 * static_cast<double>(clean) /
         static_cast<double>(files_processed_);
}

std::string EncodingStats::Summary() const {
  using secs = std::chrono::duration<double>;
  const double elapsed_s =
      std::chrono::duration_cast<secs>(elapsed_).count();

  std::ostringstream os;
  os << "Encoding statistics:\n";
  os << "  files processed:   " << files_processed_ << "\n";
  os << "  bytes processed:   " << FormatBytes(bytes_processed_) << "\n";
  os << "  conversion errors: " << conversion_errors_ << "\n";

  char rate[32];
  std::snprintf(rate, sizeof(rate), "%.1f%%", SuccessRate());
  os << "  success rate:      " << rate << "\n";

  const std::string common = MostCommonEncoding();
  if (!common.empty()) {
    os << "  most common:       " << common << "\n";
  }
  AppendCounts(os, "detected", detected_);
  AppendCounts(os, "forced", forced_);
  AppendCounts(os, "fallback", fallback_);

  char took[32];
  std::snprintf(took, sizeof(took), "%.2fs", elapsed_s);
  os << "  time spent:        " << took << "\n";
  return os.str();
}

std::string FormatBytes(std::uint64_t bytes) {
  static constexpr const char* UNITS[] = {"B", "KB", "MB", "GB", "TB"};
  static constexpr int NUM_UNITS = 5;

  if (bytes < 1000) return std::to_string(bytes) + " B";

  double size = static_cast<double>(bytes);
  int unit = 0;
  while (size >= 1000.0 && unit + 1 < NUM_UNITS) {
    size /= 1000.0;
    ++unit;
  }
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f %s", size, UNITS[unit]);
  return buf;
}

}  // namespace wlmerge
