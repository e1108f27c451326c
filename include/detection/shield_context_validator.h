#ifndef SHIELD_CONTEXT_VALIDATOR_H_
#define SHIELD_CONTEXT_VALIDATOR_H_

#include <cstddef>
#include <string>

namespace shield {

/**
 * ContextValidator - looks at the text around a candidate span
 *
 * Purely lexical: a lower-cased window on each side of [start, end) is
 * searched for keyword substrings.
 */
class ContextValidator {
 public:
  static constexpr size_t kNameWindow = 20;
  static constexpr size_t kAddressWindow = 30;

  // False if a negative keyword (file, server, code, ...) is nearby
  static bool IsLikelyNameContext(const std::string& text, size_t start, size_t end);

  // True if an address keyword (address, suite, apt, ...) is nearby
  static bool IsLikelyAddressContext(const std::string& text, size_t start, size_t end);

  // Lower-cased "before + ' ' + after" window, clipped to the text
  static std::string Window(const std::string& text, size_t start, size_t end, size_t width);
};

}  // namespace shield

#endif  // SHIELD_CONTEXT_VALIDATOR_H_
