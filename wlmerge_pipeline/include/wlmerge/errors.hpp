// wlmerge_pipeline/include/wlmerge/errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace wlmerge {

// Base for every error the merge pipeline raises on purpose.
// Encoding problems are never reported through these: they are resolved by
// fallback or by U+FFFD replacement.
class MergeError : public std::runtime_error {
 public:
  explicit MergeError(const std::string& what) : std::runtime_error(what) {}
};

// File open/read/write failures. Inside a worker these only skip one file.
class IoError : public MergeError {
 public:
  explicit IoError(const std::string& what) : MergeError("IO error: " + what) {}
};

// Invalid thread count, missing or equal input/output paths, unwritable
// output directory, malformed config JSON.
class ConfigError : public MergeError {
 public:
  explicit ConfigError(const std::string& what)
      : MergeError("Config error: " + what) {}
};

// Checkpoint missing, corrupted, or no longer matching the input list.
class ResumeError : public MergeError {
 public:
  explicit ResumeError(const std::string& what)
      : MergeError("Resume error: " + what) {}
};

// Memory information unavailable.
class SystemResourceError : public MergeError {
 public:
  explicit SystemResourceError(const std::string& what)
      : MergeError("System error: " + what) {}
};

// Producer/aggregator plumbing failures. Always fatal.
class ChannelError : public MergeError {
 public:
  explicit ChannelError(const std::string& what)
      : MergeError("Channel error: " + what) {}
};

}  // namespace wlmerge
