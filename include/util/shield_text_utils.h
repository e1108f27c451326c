#ifndef SHIELD_TEXT_UTILS_H_
#define SHIELD_TEXT_UTILS_H_

#include <cstddef>
#include <string>
#include <vector>

#include "core/shield_types.h"

namespace shield {
namespace text {

/**
 * A whitespace-delimited token and its byte span in the source text.
 */
struct Token {
  std::string word;
  size_t start;
  size_t end;
};

// Split on ASCII whitespace, keeping exact byte offsets
std::vector<Token> Tokenize(const std::string& text);

// Strip leading and trailing characters contained in `chars`
std::string Strip(const std::string& s, const char* chars);

std::string ToLower(const std::string& s);

// Only the ASCII digits of `s`, in order
std::string DigitsOnly(const std::string& s);

bool IsAllDigits(const std::string& s);

// Number of UTF-8 code points (invalid lead bytes count as one each)
size_t Utf8Length(const std::string& s);

// Byte length of the UTF-8 sequence that starts at s[0]; 0 for empty input
size_t FirstCodePointLength(const std::string& s);

/**
 * Title case check: first character upper case and the remainder lower case
 * with at least one cased letter. A single character must be upper case.
 */
bool IsCapitalizedWord(const std::string& word);

// Collapse whitespace runs to one space and trim both ends
std::string NormalizeWhitespace(const std::string& text);

/**
 * Snippet around a span for display: "...before[match]after...".
 * `window` bytes are taken on each side, clipped to the text.
 */
std::string GetContext(const std::string& text, size_t start, size_t end, size_t window = 50);

/**
 * Make arbitrary text safe to write to a log: truncate to `max_length`
 * bytes (appending "...") and replace SSN-, card- and email-shaped runs.
 */
std::string SanitizeForLogging(const std::string& text, size_t max_length = 100);

// "EMAIL: 'john@example.com' -> 'j***n@example.com' (confidence: 0.99)"
std::string FormatMatchForDisplay(const PIIMatch& match);

}  // namespace text
}  // namespace shield

#endif  // SHIELD_TEXT_UTILS_H_
