#pragma once
#include <unicode/ucnv.h>
#include <unicode/ucsdet.h>
#include <unicode/utypes.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "wlmerge/errors.hpp"

namespace wlmerge {

struct ConverterCloser {
  void operator()(UConverter* cnv) const {
    if (cnv) ucnv_close(cnv);
  }
};

struct DetectorCloser {
  void operator()(UCharsetDetector* det) const {
    if (det) ucsdet_close(det);
  }
};

using ConverterPtr = std::unique_ptr<UConverter, ConverterCloser>;
using DetectorPtr = std::unique_ptr<UCharsetDetector, DetectorCloser>;

// helper used at runtime for validation
static inline void ICU_OK(UErrorCode status, const std::string& context) {
  if (U_FAILURE(status)) {
    throw MergeError(context + ": " + u_errorName(status));
  }
}

// Open an ICU converter by label (case-insensitive, ICU alias table).
inline ConverterPtr OpenConverter(const std::string& encoding) {
  UErrorCode status = U_ZERO_ERROR;
  ConverterPtr cnv(ucnv_open(encoding.c_str(), &status));
  ICU_OK(status, "open converter '" + encoding + "'");
  return cnv;
}

// True if ICU knows a converter for this label.
inline bool IsSupportedEncoding(const std::string& encoding) {
  if (encoding.empty()) return false;
  UErrorCode status = U_ZERO_ERROR;
  ConverterPtr cnv(ucnv_open(encoding.c_str(), &status));
  return U_SUCCESS(status) && cnv != nullptr;
}

}  // namespace wlmerge
