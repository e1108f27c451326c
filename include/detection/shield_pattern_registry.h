#ifndef SHIELD_PATTERN_REGISTRY_H_
#define SHIELD_PATTERN_REGISTRY_H_

#include <optional>
#include <regex>
#include <string>
#include <vector>

#include "core/shield_types.h"

namespace shield {

/**
 * A single detection rule: one regular expression for one PII type.
 *
 * Several patterns may target the same type (four card brands, two SSN
 * layouts, ...). Candidates they produce are disambiguated later by
 * validation and overlap resolution.
 */
struct PIIPattern {
  PIIType type;
  std::string pattern;         // ECMAScript syntax
  double confidence;           // base confidence in [0,1]
  std::string description;
  bool requires_validation;
};

struct CompiledPattern {
  const PIIPattern* pattern;
  const std::regex* regex;
};

/**
 * PatternRegistry - read-only table of detection patterns
 *
 * Every pattern is compiled exactly once, in the constructor. After that the
 * registry is never mutated, so it can be shared between threads without
 * locking (std::regex matching through a const reference is thread-safe).
 */
class PatternRegistry {
 public:
  PatternRegistry();
  explicit PatternRegistry(std::vector<PIIPattern> patterns);
  ~PatternRegistry() = default;

  PatternRegistry(const PatternRegistry&) = delete;
  PatternRegistry& operator=(const PatternRegistry&) = delete;

  // Shared instance holding the built-in patterns
  static const PatternRegistry& Default();

  // Patterns in registration order, optionally restricted to one type
  std::vector<PIIPattern> Patterns(std::optional<PIIType> type = std::nullopt) const;

  // Compiled matchers; pointers stay valid for the registry's lifetime
  std::vector<CompiledPattern> Compiled(std::optional<PIIType> type = std::nullopt) const;

  size_t size() const { return patterns_.size(); }

 private:
  static std::vector<PIIPattern> BuiltinPatterns();
  void Compile();

  std::vector<PIIPattern> patterns_;
  std::vector<std::regex> compiled_;
};

}  // namespace shield

#endif  // SHIELD_PATTERN_REGISTRY_H_
