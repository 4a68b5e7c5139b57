#include "wlmerge/decoding_reader.hpp"

#include <unicode/ucnv_cb.h>

#include "wlmerge/errors.hpp"

namespace wlmerge {

namespace {

// ToU callback: substitute U+FFFD and bump the counter passed as context.
void CountingSubstitute(const void* context, UConverterToUnicodeArgs* args,
                        const char* /*code_units*/, int32_t /*length*/,
                        UConverterCallbackReason reason, UErrorCode* err) {
  if (reason > UCNV_IRREGULAR) return;  // reset/close/clone
  auto* counter = static_cast<std::uint64_t*>(const_cast<void*>(context));
  ++*counter;
  *err = U_ZERO_ERROR;
  static const UChar kReplacement = 0xFFFD;
  ucnv_cbToUWriteUChars(args, &kReplacement, 1, 0, err);
}

}  // namespace

DecodingLineReader::DecodingLineReader(const std::string& path,
                                       const std::string& encoding,
                                       std::size_t max_line)
    : src_(path),
      encoding_(encoding),
      max_line_(max_line < 4 ? 4 : max_line),
      to_unicode_(OpenConverter(encoding)),
      to_utf8_(OpenConverter("UTF-8")),
      in_buf_(READ_CHUNK),
      pivot_(READ_CHUNK),
      out_chunk_(READ_CHUNK * 3) {
  UErrorCode status = U_ZERO_ERROR;
  ucnv_setToUCallBack(to_unicode_.get(), CountingSubstitute, &replacements_,
                      nullptr, nullptr, &status);
  ICU_OK(status, "set substitution callback for " + encoding);
  pivot_source_ = pivot_.data();
  pivot_target_ = pivot_.data();
}

void DecodingLineReader::Fill() {
  const std::size_t n = src_.Read(in_buf_.data(), in_buf_.size());
  bytes_read_ += n;
  const bool flush = (n == 0);

  const char* src = in_buf_.data();
  const char* src_limit = src + n;
  for (;;) {
    char* target = out_chunk_.data();
    UErrorCode status = U_ZERO_ERROR;
    ucnv_convertEx(to_utf8_.get(), to_unicode_.get(), &target,
                   out_chunk_.data() + out_chunk_.size(), &src, src_limit,
                   pivot_.data(), &pivot_source_, &pivot_target_,
                   pivot_.data() + pivot_.size(), reset_, flush, &status);
    reset_ = false;
    text_.append(out_chunk_.data(),
                 static_cast<std::size_t>(target - out_chunk_.data()));
    if (status == U_BUFFER_OVERFLOW_ERROR) continue;
    ICU_OK(status, "convert " + src_.path() + " from " + encoding_);
    break;
  }
  if (flush) eof_ = true;
}

bool DecodingLineReader::ReadLine(std::string& line) {
  for (;;) {
    if (!bom_checked_ && (text_.size() - pos_ >= 3 || eof_)) {
      if (text_.compare(pos_, 3, "\xEF\xBB\xBF") == 0) pos_ += 3;
      bom_checked_ = true;
    }
    if (bom_checked_) {
      const auto nl = text_.find('\n', pos_ + scanned_);
      const std::size_t end = nl == std::string::npos ? text_.size() : nl;
      if (end - pos_ > max_line_) {
        // Cut on a UTF-8 lead byte; the remainder becomes the next line.
        std::size_t cut = pos_ + max_line_;
        while (cut > pos_ &&
               (static_cast<unsigned char>(text_[cut]) & 0xC0) == 0x80) {
          --cut;
        }
        if (cut == pos_) cut = pos_ + max_line_;
        line.assign(text_, pos_, cut - pos_);
        pos_ = cut;
        scanned_ = 0;
        ++split_lines_;
        return true;
      }
      if (nl != std::string::npos) {
        line.assign(text_, pos_, nl - pos_);
        pos_ = nl + 1;
        scanned_ = 0;
        return true;
      }
      scanned_ = text_.size() - pos_;
      if (eof_) {
        if (pos_ < text_.size()) {
          line.assign(text_, pos_, std::string::npos);
          pos_ = text_.size();
          scanned_ = 0;
          return true;
        }
        return false;
      }
    }
    text_.erase(0, pos_);
    pos_ = 0;
    Fill();
  }
}

}  // namespace wlmerge
