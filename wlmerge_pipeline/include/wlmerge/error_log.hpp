#pragma once

#include <fstream>
#include <mutex>
#include <string>

namespace wlmerge {

// Append-only error file, one "[YYYY-MM-DD HH:MM:SS] message" line per call.
// Independent of the console stream; every entry is echoed to std::cerr too.
class ErrorLog {
 public:
  explicit ErrorLog(std::string path);

  void Append(const std::string& message);

  std::size_t count() const;

 private:
  std::string path_;
  mutable std::mutex mu_;
  std::ofstream out_;
  bool open_failed_ = false;
  std::size_t count_ = 0;
};

// Local wall-clock timestamp used by the error log and the timing report.
std::string FormatTimestamp();

}  // namespace wlmerge
