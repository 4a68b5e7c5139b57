#include "wlmerge/batch_sizer.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "wlmerge/errors.hpp"

namespace wlmerge {

std::uint64_t ReadAvailableMemory(const std::string& meminfo_path) {
  std::ifstream in(meminfo_path);
  if (!in) {
    throw SystemResourceError("cannot read memory information from " +
                              meminfo_path);
  }

  // "MemAvailable:   16302512 kB"
  std::string line;
  while (std::getline(in, line)) {
    if (line.rfind("MemAvailable:", 0) != 0) continue;
    std::istringstream fields(line.substr(13));
    std::uint64_t kib = 0;
    std::string unit;
    if (!(fields >> kib)) break;
    fields >> unit;
    if (!unit.empty() && unit != "kB") break;
    return kib * 1024;
  }
  throw SystemResourceError("MemAvailable not found in " + meminfo_path);
}

std::size_t BatchCapacityFor(std::uint64_t available_bytes) {
  const std::uint64_t by_memory = available_bytes / 2 / LINE_OVERHEAD_BYTES;
  const std::uint64_t capacity =
      std::min<std::uint64_t>(by_memory, CHUNK_SIZE);
  return static_cast<std::size_t>(std::max<std::uint64_t>(capacity, 1));
}

std::size_t ComputeBatchCapacity(const std::string& meminfo_path) {
  return BatchCapacityFor(ReadAvailableMemory(meminfo_path));
}

}  // namespace wlmerge
