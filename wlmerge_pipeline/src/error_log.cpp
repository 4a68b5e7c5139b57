#include "wlmerge/error_log.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace wlmerge {

std::string FormatTimestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
  localtime_r(&t, &tm_buf);
  std::ostringstream oss;
  oss << std::put_time(&tm_buf, "%F %T");
  return oss.str();
}

ErrorLog::ErrorLog(std::string path) : path_(std::move(path)) {}

void ErrorLog::Append(const std::string& message) {
  const std::string line = "[" + FormatTimestamp() + "] " + message;

  std::lock_guard<std::mutex> lock(mu_);
  ++count_;
  std::cerr << "[error] " << message << "\n";

  if (path_.empty() || open_failed_) return;
  if (!out_.is_open()) {
    std::filesystem::path p(path_);
    if (p.has_parent_path()) {
      std::error_code ec;
      std::filesystem::create_directories(p.parent_path(), ec);
    }
    out_.open(path_, std::ios::out | std::ios::app);
    if (!out_) {
      // Losing the error file must not take the run down with it.
      std::cerr << "Warning: failed to open error log: " << path_ << "\n";
      open_failed_ = true;
      return;
    }
  }
  out_ << line << "\n";
  out_.flush();
}

std::size_t ErrorLog::count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return count_;
}

}  // namespace wlmerge
