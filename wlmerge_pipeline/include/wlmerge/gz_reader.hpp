#pragma once
#include <zlib.h>

#include <cstddef>
#include <string>

namespace wlmerge {

// Byte source for every input file. gzread passes plain files through
// untouched, so one reader serves both `list.txt` and `list.txt.gz`.
class GzReader {
 public:
  explicit GzReader(const std::string& path);
  ~GzReader();

  GzReader(const GzReader&) = delete;
  GzReader& operator=(const GzReader&) = delete;

  // Fill up to `n` bytes; returns 0 at end of stream. Throws IoError.
  std::size_t Read(char* dst, std::size_t n);

  const std::string& path() const { return path_; }

 private:
  std::string path_;
  gzFile f_{nullptr};
};

}  // namespace wlmerge
