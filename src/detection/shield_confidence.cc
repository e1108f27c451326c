#include "detection/shield_confidence.h"

#include <algorithm>

#include "util/shield_text_utils.h"

namespace shield {

double ConfidenceCalculator::Adjust(double base_confidence,
                                    bool context_match,
                                    bool validation_passed,
                                    bool length_appropriate) {
  double confidence = base_confidence;

  if (context_match) {
    confidence = std::min(1.0, confidence + kContextBoost);
  }
  if (!validation_passed) {
    confidence *= kValidationPenalty;
  }
  if (!length_appropriate) {
    confidence *= kLengthPenalty;
  }

  return std::max(0.0, std::min(1.0, confidence));
}

bool ConfidenceCalculator::IsLengthAppropriate(const std::string& value, PIIType type) {
  switch (type) {
    case PIIType::CREDIT_CARD: {
      size_t n = text::DigitsOnly(value).size();
      return n >= 13 && n <= 19;
    }
    case PIIType::SSN:
      return text::DigitsOnly(value).size() == 9;
    default:
      return true;
  }
}

}  // namespace shield
