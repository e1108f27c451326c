#ifndef SHIELD_CONFIDENCE_H_
#define SHIELD_CONFIDENCE_H_

#include <string>

#include "core/shield_types.h"

namespace shield {

class ConfidenceCalculator {
 public:
  static constexpr double kContextBoost = 0.1;
  static constexpr double kValidationPenalty = 0.5;
  static constexpr double kLengthPenalty = 0.7;

  /**
   * Final score from a pattern's base confidence.
   *
   * The context boost is added (capped at 1.0) before the multiplicative
   * penalties; the result is clamped to [0, 1].
   */
  static double Adjust(double base_confidence,
                       bool context_match,
                       bool validation_passed,
                       bool length_appropriate);

  // Cards need 13-19 digits, SSNs exactly 9; other types always pass
  static bool IsLengthAppropriate(const std::string& value, PIIType type);
};

}  // namespace shield

#endif  // SHIELD_CONFIDENCE_H_
