#include "wlmerge/timing.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <thread>

#include "wlmerge/error_log.hpp"

namespace wlmerge {

TimingRegistry& TimingRegistry::Instance() {
  static TimingRegistry instance;
  return instance;
}

void TimingRegistry::Add(std::string name,
                         std::chrono::steady_clock::duration d) {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.push_back(TimingEntry{std::move(name), d});
}

std::vector<TimingEntry> TimingRegistry::Entries() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_;
}

void TimingRegistry::Clear() {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.clear();
}

namespace {

constexpr int NAME_WIDTH = 28;
constexpr int VALUE_WIDTH = 14;

struct StageTotal {
  std::string name;
  std::uint64_t calls = 0;
  std::chrono::steady_clock::duration total{};
};

// Repeated stages (one per resume, one per worker) fold into one row, in
// order of first appearance.
std::vector<StageTotal> FoldStages(const std::vector<TimingEntry>& entries) {
  std::vector<StageTotal> stages;
  for (const auto& e : entries) {
    auto it = std::find_if(stages.begin(), stages.end(),
                           [&](const StageTotal& s) { return s.name == e.name; });
    if (it == stages.end()) {
      stages.push_back(StageTotal{e.name, 0, {}});
      it = std::prev(stages.end());
    }
    ++it->calls;
    it->total += e.duration;
  }
  return stages;
}

double Millis(std::chrono::steady_clock::duration d) {
  return std::chrono::duration<double, std::milli>(d).count();
}

}  // namespace

void WriteTimingReport(const std::string& out_path,
                       const std::string& program_name,
                       const std::vector<std::string>& args,
                       const RunCounters& counters,
                       bool append) {
  std::filesystem::path p(out_path);
  if (p.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) {
      std::cerr << "Warning: failed to create timing directory: "
                << ec.message() << "\n";
    }
  }

  std::ofstream out(out_path, append ? std::ios::app : std::ios::trunc);
  if (!out) {
    std::cerr << "Failed to open timing report file: " << out_path << "\n";
    return;
  }

  const unsigned hw = std::thread::hardware_concurrency();
  out << "\n== " << program_name << " @ " << FormatTimestamp()
      << " (hw threads " << (hw == 0 ? 1 : hw) << ") ==\n";
  out << "args:";
  for (const auto& a : args) out << " " << a;
  out << "\n";

  out << std::left << std::setw(NAME_WIDTH) << "stage" << std::right
      << std::setw(VALUE_WIDTH) << "calls" << std::setw(VALUE_WIDTH)
      << "total_ms" << std::setw(VALUE_WIDTH) << "avg_ms" << "\n";
  out << std::fixed << std::setprecision(3);
  for (const auto& s : FoldStages(TimingRegistry::Instance().Entries())) {
    const double total = Millis(s.total);
    out << std::left << std::setw(NAME_WIDTH) << s.name << std::right
        << std::setw(VALUE_WIDTH) << s.calls << std::setw(VALUE_WIDTH) << total
        << std::setw(VALUE_WIDTH) << total / static_cast<double>(s.calls)
        << "\n";
  }

  for (const auto& [name, value] : counters) {
    out << std::left << std::setw(NAME_WIDTH) << ("#" + name) << std::right
        << std::setw(VALUE_WIDTH) << value << "\n";
  }
}

}  // namespace wlmerge
