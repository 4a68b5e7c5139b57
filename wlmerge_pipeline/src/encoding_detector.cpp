#include <unicode/uchar.h>
#include <unicode/ucnv.h>
#include <unicode/ucsdet.h>
#include <unicode/utf16.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <system_error>

#include "wlmerge/encoding.hpp"
#include "wlmerge/encoding_stats.hpp"
#include "wlmerge/errors.hpp"
#include "wlmerge/gz_reader.hpp"
#include "wlmerge/icu_utils.hpp"

namespace wlmerge {

namespace {

struct StrictDecode {
  bool ok = false;
  std::vector<UChar32> code_points;
};

// Decode with the STOP callback: any illegal or unassigned sequence fails
// the whole sample.
StrictDecode DecodeStrict(std::string_view bytes, const std::string& encoding,
                          bool complete) {
  StrictDecode out;
  UErrorCode status = U_ZERO_ERROR;
  ConverterPtr cnv(ucnv_open(encoding.c_str(), &status));
  if (U_FAILURE(status)) return out;
  if (bytes.empty()) {
    out.ok = true;
    return out;
  }

  ucnv_setToUCallBack(cnv.get(), UCNV_TO_U_CALLBACK_STOP, nullptr, nullptr,
                      nullptr, &status);
  if (U_FAILURE(status)) return out;

  // Single-byte charsets and UTF-8 never yield more than one UTF-16 unit per
  // input byte.
  std::vector<UChar> buf(bytes.size() + 16);
  UChar* target = buf.data();
  const char* src = bytes.data();
  ucnv_toUnicode(cnv.get(), &target, buf.data() + buf.size(), &src,
                 bytes.data() + bytes.size(), nullptr, complete, &status);
  if (U_FAILURE(status)) return out;

  const int32_t len = static_cast<int32_t>(target - buf.data());
  out.code_points.reserve(static_cast<std::size_t>(len));
  for (int32_t i = 0; i < len;) {
    UChar32 c;
    U16_NEXT(buf.data(), i, len, c);
    out.code_points.push_back(c);
  }
  out.ok = true;
  return out;
}

bool IsPlausible(UChar32 c) {
  return u_isalnum(c) || u_ispunct(c) || u_isUWhiteSpace(c);
}

bool IsPrintableOrSpace(UChar32 c) {
  return u_isprint(c) || u_isUWhiteSpace(c);
}

bool EqualsIgnoreCase(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

bool HasHighBytes(std::string_view bytes) {
  return std::any_of(bytes.begin(), bytes.end(), [](char c) {
    return static_cast<unsigned char>(c) >= 0x80;
  });
}

EncodingProfile Profile(const char* name, EncodingBasis basis) {
  return EncodingProfile{name, basis, 0, false};
}

}  // namespace

const char* ToString(EncodingBasis basis) {
  switch (basis) {
    case EncodingBasis::Detected:
      return "detected";
    case EncodingBasis::Heuristic:
      return "heuristic";
    case EncodingBasis::Forced:
      return "forced";
    case EncodingBasis::Sequence:
      return "sequence";
    case EncodingBasis::Fallback:
      return "fallback";
  }
  return "unknown";
}

const std::vector<std::string>& CandidateEncodings() {
  static const std::vector<std::string> kCandidates = {
      "UTF-8",       "windows-1252", "ISO-8859-1",
      "ISO-8859-15", "ISO-8859-2",   "windows-1250"};
  return kCandidates;
}

std::string CanonicalEncodingName(std::string_view name) {
  if (EqualsIgnoreCase(name, "ISO-8859-1")) return LEGACY_ENCODING;
  for (const auto& c : CandidateEncodings()) {
    if (EqualsIgnoreCase(name, c)) return c;
  }
  return {};
}

bool HasUtf8Bom(std::string_view bytes) {
  return bytes.size() >= 3 && bytes.compare(0, 3, "\xEF\xBB\xBF") == 0;
}

bool IsValidUtf8(std::string_view bytes, bool complete) {
  return DecodeStrict(bytes, UTF8_ENCODING, complete).ok;
}

bool ValidateSample(std::string_view sample, const std::string& encoding,
                    bool complete) {
  const StrictDecode d = DecodeStrict(sample, encoding, complete);
  if (!d.ok) return false;
  if (d.code_points.empty()) return true;

  const auto nuls = std::count(d.code_points.begin(), d.code_points.end(), 0);
  const double nul_ratio =
      static_cast<double>(nuls) / static_cast<double>(d.code_points.size());
  if (nul_ratio > MAX_NUL_RATIO) return false;

  return std::any_of(d.code_points.begin(), d.code_points.end(), IsPlausible);
}

double Confidence(std::string_view sample, const std::string& encoding,
                  bool complete) {
  const StrictDecode d = DecodeStrict(sample, encoding, complete);
  if (!d.ok) return 0.0;
  if (d.code_points.empty()) return 1.0;
  const auto printable = std::count_if(d.code_points.begin(),
                                       d.code_points.end(), IsPrintableOrSpace);
  return static_cast<double>(printable) /
         static_cast<double>(d.code_points.size());
}

bool IsLikelyBinary(std::string_view sample) {
  if (sample.empty()) return false;
  const auto nuls = std::count(sample.begin(), sample.end(), '\0');
  return static_cast<double>(nuls) / static_cast<double>(sample.size()) >
         BINARY_NUL_RATIO;
}

std::optional<EncodingProfile> GuessStatistically(std::string_view sample) {
  if (sample.empty()) return std::nullopt;

  UErrorCode status = U_ZERO_ERROR;
  DetectorPtr det(ucsdet_open(&status));
  if (U_FAILURE(status)) return std::nullopt;

  ucsdet_setText(det.get(), sample.data(), static_cast<int32_t>(sample.size()),
                 &status);
  int32_t found = 0;
  const UCharsetMatch** matches = ucsdet_detectAll(det.get(), &found, &status);
  if (U_FAILURE(status) || matches == nullptr) return std::nullopt;

  // Matches come sorted by descending confidence.
  for (int32_t i = 0; i < found; ++i) {
    UErrorCode s = U_ZERO_ERROR;
    const int32_t confidence = ucsdet_getConfidence(matches[i], &s);
    if (U_FAILURE(s) || confidence < MIN_DETECTION_CONFIDENCE) break;
    const char* name = ucsdet_getName(matches[i], &s);
    if (U_FAILURE(s) || name == nullptr) continue;

    std::string canonical = CanonicalEncodingName(name);
    if (!canonical.empty()) {
      return EncodingProfile{std::move(canonical), EncodingBasis::Detected,
                             confidence, false};
    }
  }
  return std::nullopt;
}

const std::vector<DetectionRule>& DetectionRules() {
  static const std::vector<DetectionRule> kRules = {
      {"empty",
       [](std::string_view sample, bool) -> std::optional<EncodingProfile> {
         if (sample.empty()) {
           return Profile(UTF8_ENCODING, EncodingBasis::Heuristic);
         }
         return std::nullopt;
       }},
      {"statistical",
       [](std::string_view sample,
          bool complete) -> std::optional<EncodingProfile> {
         auto guess = GuessStatistically(sample);
         if (guess && ValidateSample(sample, guess->name, complete)) {
           return guess;
         }
         return std::nullopt;
       }},
      {"utf8-bom",
       [](std::string_view sample, bool) -> std::optional<EncodingProfile> {
         if (HasUtf8Bom(sample)) {
           return Profile(UTF8_ENCODING, EncodingBasis::Heuristic);
         }
         return std::nullopt;
       }},
      {"utf8-valid",
       [](std::string_view sample,
          bool complete) -> std::optional<EncodingProfile> {
         if (IsValidUtf8(sample, complete)) {
           return Profile(UTF8_ENCODING, EncodingBasis::Heuristic);
         }
         return std::nullopt;
       }},
      {"high-bytes",
       [](std::string_view sample, bool) -> std::optional<EncodingProfile> {
         if (HasHighBytes(sample)) {
           return Profile(LEGACY_ENCODING, EncodingBasis::Fallback);
         }
         return std::nullopt;
       }},
  };
  return kRules;
}

EncodingProfile DetectSampleEncoding(std::string_view sample, bool complete) {
  for (const auto& rule : DetectionRules()) {
    if (auto p = rule.resolve(sample, complete)) return *p;
  }
  // Only reachable for 7-bit samples that ICU refuses as UTF-8 (none today).
  return Profile(UTF8_ENCODING, EncodingBasis::Heuristic);
}

std::string ReadSample(const std::string& path, std::size_t max_bytes,
                       bool* complete) {
  GzReader reader(path);
  std::string sample(max_bytes, '\0');
  std::size_t filled = 0;
  while (filled < max_bytes) {
    const std::size_t n = reader.Read(sample.data() + filled, max_bytes - filled);
    if (n == 0) break;
    filled += n;
  }
  sample.resize(filled);

  if (complete) {
    if (filled < max_bytes) {
      *complete = true;
    } else {
      char probe;
      *complete = reader.Read(&probe, 1) == 0;
    }
  }
  return sample;
}

EncodingProfile DetectFileEncoding(const std::string& path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(path, ec);
  if (ec) throw IoError("cannot stat " + path + ": " + ec.message());

  if (size == 0) return Profile(UTF8_ENCODING, EncodingBasis::Heuristic);
  if (size > MAX_DETECTION_FILE_SIZE) {
    return Profile(LEGACY_ENCODING, EncodingBasis::Fallback);
  }

  bool complete = false;
  const std::string sample = ReadSample(path, DETECTION_SAMPLE_SIZE, &complete);
  EncodingProfile profile = DetectSampleEncoding(sample, complete);
  profile.likely_binary = IsLikelyBinary(sample);
  return profile;
}

EncodingProfile ResolveEncoding(const std::string& path,
                                const EncodingStrategy& strategy,
                                EncodingStats* stats) {
  EncodingProfile profile;
  switch (strategy.mode()) {
    case EncodingStrategy::Mode::AutoDetect:
      profile = DetectFileEncoding(path);
      break;
    case EncodingStrategy::Mode::Force:
      profile = EncodingProfile{strategy.encodings().front(),
                                EncodingBasis::Forced, 0, false};
      break;
    case EncodingStrategy::Mode::TrySequence: {
      bool complete = false;
      const std::string sample =
          ReadSample(path, DETECTION_SAMPLE_SIZE, &complete);
      profile = Profile(LEGACY_ENCODING, EncodingBasis::Fallback);
      for (const auto& enc : strategy.encodings()) {
        if (ValidateSample(sample, enc, complete)) {
          profile = EncodingProfile{enc, EncodingBasis::Sequence, 0, false};
          break;
        }
      }
      profile.likely_binary = IsLikelyBinary(sample);
      break;
    }
  }

  if (stats) {
    stats->RecordFileProcessed();
    switch (profile.basis) {
      case EncodingBasis::Forced:
        stats->RecordForced(profile.name);
        break;
      case EncodingBasis::Fallback:
        stats->RecordFallback(profile.name);
        break;
      default:
        stats->RecordDetected(profile.name);
        break;
    }
  }
  return profile;
}

}  // namespace wlmerge
