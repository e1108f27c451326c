#include "util/shield_text_utils.h"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <regex>
#include <sstream>

namespace shield {
namespace text {

namespace {

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool IsUpper(char c) {
  return std::isupper(static_cast<unsigned char>(c)) != 0;
}

bool IsLower(char c) {
  return std::islower(static_cast<unsigned char>(c)) != 0;
}

// UTF-8 continuation byte (10xxxxxx)
bool IsContinuation(char c) {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

}  // namespace

std::vector<Token> Tokenize(const std::string& text) {
  std::vector<Token> tokens;
  size_t i = 0;
  const size_t n = text.size();
  while (i < n) {
    while (i < n && IsSpace(text[i])) ++i;
    if (i >= n) break;
    size_t start = i;
    while (i < n && !IsSpace(text[i])) ++i;
    tokens.push_back({text.substr(start, i - start), start, i});
  }
  return tokens;
}

std::string Strip(const std::string& s, const char* chars) {
  size_t begin = s.find_first_not_of(chars);
  if (begin == std::string::npos) {
    return "";
  }
  size_t end = s.find_last_not_of(chars);
  return s.substr(begin, end - begin + 1);
}

std::string ToLower(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string DigitsOnly(const std::string& s) {
  std::string digits;
  digits.reserve(s.size());
  for (char c : s) {
    if (c >= '0' && c <= '9') {
      digits.push_back(c);
    }
  }
  return digits;
}

bool IsAllDigits(const std::string& s) {
  return !s.empty() &&
         std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

size_t Utf8Length(const std::string& s) {
  size_t count = 0;
  for (unsigned char c : s) {
    // Continuation bytes (10xxxxxx) do not start a code point
    if ((c & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

size_t FirstCodePointLength(const std::string& s) {
  if (s.empty()) {
    return 0;
  }
  size_t len = 1;
  while (len < s.size() && IsContinuation(s[len])) {
    ++len;
  }
  return len;
}

bool IsCapitalizedWord(const std::string& word) {
  if (word.empty()) {
    return false;
  }
  if (word.size() == 1) {
    return IsUpper(word[0]);
  }
  if (!IsUpper(word[0])) {
    return false;
  }
  bool has_cased = false;
  for (size_t i = 1; i < word.size(); ++i) {
    if (IsUpper(word[i])) {
      return false;
    }
    if (IsLower(word[i])) {
      has_cased = true;
    }
  }
  return has_cased;
}

std::string NormalizeWhitespace(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (char c : text) {
    if (IsSpace(c)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(c);
  }
  return out;
}

std::string GetContext(const std::string& text, size_t start, size_t end, size_t window) {
  end = std::min(end, text.size());
  start = std::min(start, end);
  size_t context_start = start > window ? start - window : 0;
  size_t context_end = std::min(text.size(), end + window);

  // Never cut a multibyte character in half; the partial one is dropped
  while (context_start < start && IsContinuation(text[context_start])) {
    ++context_start;
  }
  while (context_end > end && context_end < text.size() && IsContinuation(text[context_end])) {
    --context_end;
  }

  std::string out = "...";
  out += text.substr(context_start, start - context_start);
  out += "[";
  out += text.substr(start, end - start);
  out += "]";
  out += text.substr(end, context_end - end);
  out += "...";
  return out;
}

std::string SanitizeForLogging(const std::string& text, size_t max_length) {
  static const std::regex ssn_re(R"(\b\d{3}-\d{2}-\d{4}\b)");
  static const std::regex card_re(R"(\b\d{16}\b)");
  static const std::regex email_re(R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Z|a-z]{2,}\b)");

  std::string result = text;
  if (result.size() > max_length) {
    result = result.substr(0, max_length) + "...";
  }

  result = std::regex_replace(result, ssn_re, "[SSN]");
  result = std::regex_replace(result, card_re, "[CARD]");
  result = std::regex_replace(result, email_re, "[EMAIL]");
  return result;
}

std::string FormatMatchForDisplay(const PIIMatch& match) {
  std::ostringstream ss;
  ss << TypeName(match.type) << ": '" << match.value << "' -> '"
     << match.masked_value << "' (confidence: "
     << std::fixed << std::setprecision(2) << match.confidence << ")";
  return ss.str();
}

}  // namespace text
}  // namespace shield
