#pragma once

#include <unicode/ucnv.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "wlmerge/gz_reader.hpp"
#include "wlmerge/icu_utils.hpp"

namespace wlmerge {

// Streams one input file as UTF-8 lines.
//
// Bytes come through GzReader (plain or gzip), are converted from
// `encoding` to UTF-8 with ucnv_convertEx, and split on '\n'. Illegal or
// unassigned input sequences become U+FFFD and are counted; they never
// abort the file. A leading UTF-8 BOM is dropped. Lines are returned
// untrimmed ('\r' included). A line longer than `max_line` bytes is split
// at a character boundary so input without newlines stays bounded.
class DecodingLineReader {
 public:
  static constexpr std::size_t READ_CHUNK = 64 * 1024;
  static constexpr std::size_t MAX_LINE_BYTES = 10 * 1024 * 1024;

  DecodingLineReader(const std::string& path, const std::string& encoding,
                     std::size_t max_line = MAX_LINE_BYTES);

  DecodingLineReader(const DecodingLineReader&) = delete;
  DecodingLineReader& operator=(const DecodingLineReader&) = delete;

  // False at end of stream. Throws IoError on read failure.
  bool ReadLine(std::string& line);

  std::uint64_t bytes_read() const { return bytes_read_; }
  std::uint64_t replacements() const { return replacements_; }
  // Lines cut at max_line.
  std::uint64_t split_lines() const { return split_lines_; }

 private:
  void Fill();

  GzReader src_;
  std::string encoding_;
  std::size_t max_line_;
  ConverterPtr to_unicode_;
  ConverterPtr to_utf8_;

  std::vector<char> in_buf_;
  std::vector<UChar> pivot_;
  UChar* pivot_source_ = nullptr;
  UChar* pivot_target_ = nullptr;
  std::vector<char> out_chunk_;

  std::string text_;
  std::size_t pos_ = 0;
  // Bytes after pos_ already known to hold no '\n'.
  std::size_t scanned_ = 0;
  bool reset_ = true;
  bool eof_ = false;
  bool bom_checked_ = false;

  std::uint64_t bytes_read_ = 0;
  std::uint64_t replacements_ = 0;
  std::uint64_t split_lines_ = 0;
};

}  // namespace wlmerge
