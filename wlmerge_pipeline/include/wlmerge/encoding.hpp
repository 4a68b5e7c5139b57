// wlmerge_pipeline/include/wlmerge/encoding.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wlmerge {

class EncodingStats;

// Prefix read for detection.
static constexpr std::size_t DETECTION_SAMPLE_SIZE = 8192;
// Above this size the file is assumed to be LEGACY_ENCODING unsampled.
static constexpr std::uint64_t MAX_DETECTION_FILE_SIZE = 100ull * 1024 * 1024;
// ucsdet confidence is 0..100.
static constexpr int MIN_DETECTION_CONFIDENCE = 10;
static constexpr double MAX_NUL_RATIO = 0.05;
static constexpr double BINARY_NUL_RATIO = 0.10;

inline constexpr const char* UTF8_ENCODING = "UTF-8";
inline constexpr const char* LEGACY_ENCODING = "windows-1252";

// How an EncodingProfile was reached.
enum class EncodingBasis {
  Detected,   // statistical guess that passed validation
  Heuristic,  // BOM / valid UTF-8 / empty file
  Forced,     // explicit override
  Sequence,   // first entry of a try-sequence that validated
  Fallback,   // legacy default (high bytes, size ceiling, sequence exhausted)
};

const char* ToString(EncodingBasis basis);

struct EncodingProfile {
  std::string name;
  EncodingBasis basis = EncodingBasis::Heuristic;
  int confidence = 0;  // ucsdet confidence, Detected only
  bool likely_binary = false;  // set only when a sample was read
};

class EncodingStrategy {
 public:
  enum class Mode { AutoDetect, Force, TrySequence };

  static EncodingStrategy AutoDetect();
  static EncodingStrategy Force(std::string encoding);
  static EncodingStrategy TrySequence(std::vector<std::string> encodings);
  // UTF-8 -> windows-1252 -> ISO-8859-15 -> ISO-8859-2
  static EncodingStrategy DefaultWordlistSequence();

  // "auto", "force:<name>", "sequence" or "sequence:a,b,...".
  // Throws ConfigError on bad syntax or an encoding ICU does not know.
  static EncodingStrategy Parse(const std::string& text);

  Mode mode() const { return mode_; }
  const std::vector<std::string>& encodings() const { return encodings_; }

  // "auto-detect", "force X", "try sequence: A -> B"
  std::string ToString() const;

 private:
  EncodingStrategy(Mode mode, std::vector<std::string> encodings)
      : mode_(mode), encodings_(std::move(encodings)) {}

  Mode mode_;
  std::vector<std::string> encodings_;
};

// Closed list the statistical guesser may answer with.
const std::vector<std::string>& CandidateEncodings();

// Map an ICU charset name onto the candidate list; ISO-8859-1 becomes
// windows-1252. Returns "" for anything outside the list.
std::string CanonicalEncodingName(std::string_view name);

bool HasUtf8Bom(std::string_view bytes);

// `complete` is false when `bytes` is a truncated prefix of the file: a
// multi-byte sequence cut at the end is then not an error.
bool IsValidUtf8(std::string_view bytes, bool complete);

// Decode `sample` with `encoding` and reject on decoding errors, more than
// 5% NUL code points, or no alphanumeric/punctuation/whitespace content.
bool ValidateSample(std::string_view sample, const std::string& encoding,
                    bool complete);

// 0 if the sample does not decode cleanly, otherwise the share of
// printable or whitespace code points. 1.0 for an empty sample.
double Confidence(std::string_view sample, const std::string& encoding,
                  bool complete = true);

// More than 10% NUL bytes.
bool IsLikelyBinary(std::string_view sample);

// ICU ucsdet guess restricted to CandidateEncodings().
std::optional<EncodingProfile> GuessStatistically(std::string_view sample);

// One row of the detection chain. Rows are tried in order; the first one
// returning a profile wins.
struct DetectionRule {
  const char* name;
  std::function<std::optional<EncodingProfile>(std::string_view sample,
                                               bool complete)>
      resolve;
};

const std::vector<DetectionRule>& DetectionRules();

// Runs DetectionRules() over a sample. Never fails.
EncodingProfile DetectSampleEncoding(std::string_view sample, bool complete);

// Decompressed prefix of `path`, at most `max_bytes`. `*complete` is set
// when the whole stream fit. Throws IoError.
std::string ReadSample(const std::string& path, std::size_t max_bytes,
                       bool* complete);

// Empty -> UTF-8, above MAX_DETECTION_FILE_SIZE -> LEGACY_ENCODING, else
// sample detection. Only filesystem failures throw (IoError).
EncodingProfile DetectFileEncoding(const std::string& path);

// Apply a strategy to one file and record the choice in `stats` (may be
// null). Only filesystem failures throw.
EncodingProfile ResolveEncoding(const std::string& path,
                                const EncodingStrategy& strategy,
                                EncodingStats* stats);

}  // namespace wlmerge
