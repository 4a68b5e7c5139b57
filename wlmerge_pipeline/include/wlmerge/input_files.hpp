#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace wlmerge {

class ErrorLog;

static constexpr std::uint64_t SMALL_FILE_LIMIT = 100ull * 1024 * 1024;
static constexpr std::uint64_t MEDIUM_FILE_LIMIT = 1000ull * 1024 * 1024;

struct FileDescriptor {
  std::string path;
  std::uint64_t byte_size = 0;
};

// One path per line, whitespace trimmed, blank lines skipped.
// Throws IoError if the list cannot be read.
std::vector<std::string> ReadInputList(const std::string& list_path);

// Stat every path. Missing or non-regular entries are logged and dropped.
std::vector<FileDescriptor> CollectFileMetadata(
    const std::vector<std::string>& paths, ErrorLog* error_log);

// Large (>= MEDIUM_FILE_LIMIT) first, then medium, then small; each bucket
// sorted by descending size.
std::vector<FileDescriptor> OptimizeProcessingOrder(
    std::vector<FileDescriptor> files);

}  // namespace wlmerge
