#include <sstream>

#include "wlmerge/encoding.hpp"
#include "wlmerge/errors.hpp"
#include "wlmerge/icu_utils.hpp"

namespace wlmerge {

namespace {

std::string TrimCopy(const std::string& s) {
  const auto b = s.find_first_not_of(" \t");
  if (b == std::string::npos) return {};
  const auto e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

void RequireSupported(const std::string& encoding) {
  if (!IsSupportedEncoding(encoding)) {
    throw ConfigError("unknown encoding '" + encoding + "'");
  }
}

}  // namespace

EncodingStrategy EncodingStrategy::AutoDetect() {
  return EncodingStrategy(Mode::AutoDetect, {});
}

EncodingStrategy EncodingStrategy::Force(std::string encoding) {
  return EncodingStrategy(Mode::Force, {std::move(encoding)});
}

EncodingStrategy EncodingStrategy::TrySequence(
    std::vector<std::string> encodings) {
  return EncodingStrategy(Mode::TrySequence, std::move(encodings));
}

EncodingStrategy EncodingStrategy::DefaultWordlistSequence() {
  return TrySequence({"UTF-8", "windows-1252", "ISO-8859-15", "ISO-8859-2"});
}

EncodingStrategy EncodingStrategy::Parse(const std::string& text) {
  const std::string spec = TrimCopy(text);
  if (spec == "auto") return AutoDetect();

  if (spec.rfind("force:", 0) == 0) {
    const std::string enc = TrimCopy(spec.substr(6));
    RequireSupported(enc);
    return Force(enc);
  }

  if (spec == "sequence") return DefaultWordlistSequence();

  if (spec.rfind("sequence:", 0) == 0) {
    std::vector<std::string> encodings;
    std::stringstream ss(spec.substr(9));
    std::string item;
    while (std::getline(ss, item, ',')) {
      item = TrimCopy(item);
      if (item.empty()) continue;
      RequireSupported(item);
      encodings.push_back(item);
    }
    if (encodings.empty()) {
      throw ConfigError("empty encoding sequence in '" + text + "'");
    }
    return TrySequence(std::move(encodings));
  }

  throw ConfigError("bad --encoding value '" + text +
                    "' (expected auto, force:<name> or sequence[:a,b,...])");
}

std::string EncodingStrategy::ToString() const {
  switch (mode_) {
    case Mode::AutoDetect:
      return "auto-detect";
    case Mode::Force:
      return "force " + encodings_.front();
    case Mode::TrySequence: {
      std::string out = "try sequence: ";
      for (std::size_t i = 0; i < encodings_.size(); ++i) {
        if (i) out += " -> ";
        out += encodings_[i];
      }
      return out;
    }
  }
  return "unknown";
}

}  // namespace wlmerge
