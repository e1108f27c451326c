#include "detection/shield_context_validator.h"

#include <algorithm>
#include <vector>

#include "util/shield_text_utils.h"

namespace shield {

namespace {

const std::vector<std::string>& NameNegativeKeywords() {
  static const std::vector<std::string> keywords = {
    "file", "folder", "document", "system", "server",
    "application", "program", "code", "variable"
  };
  return keywords;
}

const std::vector<std::string>& AddressKeywords() {
  static const std::vector<std::string> keywords = {
    "address", "located", "live", "office", "building",
    "suite", "floor", "unit", "apt", "apartment"
  };
  return keywords;
}

bool ContainsAny(const std::string& haystack, const std::vector<std::string>& needles) {
  return std::any_of(needles.begin(), needles.end(), [&](const std::string& kw) {
    return haystack.find(kw) != std::string::npos;
  });
}

}  // namespace

std::string ContextValidator::Window(const std::string& text, size_t start, size_t end,
                                     size_t width) {
  end = std::min(end, text.size());
  start = std::min(start, end);
  size_t before_start = start > width ? start - width : 0;
  size_t after_end = std::min(text.size(), end + width);

  return text::ToLower(text.substr(before_start, start - before_start)) + " " +
         text::ToLower(text.substr(end, after_end - end));
}

bool ContextValidator::IsLikelyNameContext(const std::string& text, size_t start, size_t end) {
  // Absence of negatives is enough; positive cues are not required
  const std::string context = Window(text, start, end, kNameWindow);
  return !ContainsAny(context, NameNegativeKeywords());
}

bool ContextValidator::IsLikelyAddressContext(const std::string& text, size_t start,
                                              size_t end) {
  const std::string context = Window(text, start, end, kAddressWindow);
  return ContainsAny(context, AddressKeywords());
}

}  // namespace shield
