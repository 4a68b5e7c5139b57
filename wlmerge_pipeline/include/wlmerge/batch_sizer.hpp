#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace wlmerge {

// Absolute line ceiling per batch, and the per-batch byte threshold.
static constexpr std::size_t CHUNK_SIZE = 10 * 1024 * 1024;
// Estimated per-line overhead of a batch entry.
static constexpr std::size_t LINE_OVERHEAD_BYTES = sizeof(std::string);

inline constexpr const char* DEFAULT_MEMINFO_PATH = "/proc/meminfo";

// MemAvailable in bytes. Throws SystemResourceError when the file is
// unreadable or has no parsable MemAvailable line.
std::uint64_t ReadAvailableMemory(const std::string& meminfo_path =
                                      DEFAULT_MEMINFO_PATH);

// min(available / 2 / LINE_OVERHEAD_BYTES, CHUNK_SIZE), at least 1.
std::size_t BatchCapacityFor(std::uint64_t available_bytes);

// Queried once per run.
std::size_t ComputeBatchCapacity(const std::string& meminfo_path =
                                     DEFAULT_MEMINFO_PATH);

}  // namespace wlmerge
