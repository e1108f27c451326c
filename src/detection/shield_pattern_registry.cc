#include "detection/shield_pattern_registry.h"

#include <utility>

#include "util/logger.h"

namespace shield {

PatternRegistry::PatternRegistry() : PatternRegistry(BuiltinPatterns()) {}

PatternRegistry::PatternRegistry(std::vector<PIIPattern> patterns)
    : patterns_(std::move(patterns)) {
  Compile();
}

const PatternRegistry& PatternRegistry::Default() {
  static const PatternRegistry registry;
  return registry;
}

std::vector<PIIPattern> PatternRegistry::BuiltinPatterns() {
  return {
    // Credit cards - one pattern per brand, all Luhn-checked
    {PIIType::CREDIT_CARD,
     R"re(\b4\d{3}[\s\-]?\d{4}[\s\-]?\d{4}[\s\-]?\d{4}\b)re",
     0.95, "Visa credit card", true},
    {PIIType::CREDIT_CARD,
     R"re(\b5[1-5]\d{2}[\s\-]?\d{4}[\s\-]?\d{4}[\s\-]?\d{4}\b)re",
     0.95, "Mastercard", true},
    {PIIType::CREDIT_CARD,
     R"re(\b3[47]\d{2}[\s\-]?\d{6}[\s\-]?\d{5}\b)re",
     0.95, "American Express", true},
    {PIIType::CREDIT_CARD,
     R"re(\b6(?:011|5\d{2})[\s\-]?\d{4}[\s\-]?\d{4}[\s\-]?\d{4}\b)re",
     0.95, "Discover card", true},

    // SSN
    {PIIType::SSN,
     R"re(\b(?!000|666|9\d{2})\d{3}[\s\-]?(?!00)\d{2}[\s\-]?(?!0000)\d{4}\b)re",
     0.98, "Social Security Number with separators", true},
    {PIIType::SSN,
     R"re(\b(?!000|666|9\d{2})\d{3}(?!00)\d{2}(?!0000)\d{4}\b)re",
     0.98, "Social Security Number without separators", true},

    // Email
    {PIIType::EMAIL,
     R"re(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Z|a-z]{2,}\b)re",
     0.99, "Email address", false},

    // Phone
    {PIIType::PHONE,
     R"re(\b(?:\+?1[\s\-]?)?\(?([0-9]{3})\)?[\s\-]?([0-9]{3})[\s\-]?([0-9]{4})\b)re",
     0.85, "US phone number", false},
    {PIIType::PHONE,
     R"re(\b(?:\+\d{1,3}[\s\-]?)?\d{2,4}[\s\-]?\d{3,4}[\s\-]?\d{3,4}\b)re",
     0.80, "International phone number", false},

    // IPv4
    {PIIType::IP_ADDRESS,
     R"re(\b(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3}(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\b)re",
     0.90, "IPv4 address", false},

    // Date of birth
    {PIIType::DATE_OF_BIRTH,
     R"re(\b(?:0[1-9]|1[0-2])[/\-](?:0[1-9]|[12][0-9]|3[01])[/\-](?:19|20)\d{2}\b)re",
     0.75, "Date of birth MM/DD/YYYY", false},
    {PIIType::DATE_OF_BIRTH,
     R"re(\b(?:0[1-9]|[12][0-9]|3[01])[/\-](?:0[1-9]|1[0-2])[/\-](?:19|20)\d{2}\b)re",
     0.75, "Date of birth DD/MM/YYYY", false},

    // Passport
    {PIIType::PASSPORT,
     R"re(\b[A-Z]{1,2}\d{6,9}\b)re",
     0.70, "US Passport number", false},

    // Driver license
    {PIIType::DRIVER_LICENSE,
     R"re(\b[A-Z]\d{7,8}\b)re",
     0.65, "Driver license (CA, TX, etc.)", false},
    {PIIType::DRIVER_LICENSE,
     R"re(\b\d{9}\b)re",
     0.60, "Driver license (FL, etc.)", false},

    // Bank account
    {PIIType::BANK_ACCOUNT,
     R"re(\b\d{8,17}\b)re",
     0.50, "Bank account number", false},

    // Tax ID (EIN)
    {PIIType::TAX_ID,
     R"re(\b\d{2}[\-]?\d{7}\b)re",
     0.75, "Tax identification number", false},
  };
}

void PatternRegistry::Compile() {
  compiled_.clear();
  compiled_.reserve(patterns_.size());
  for (const auto& p : patterns_) {
    // A bad built-in pattern is a programming error; let regex_error escape
    compiled_.emplace_back(p.pattern, std::regex::ECMAScript | std::regex::optimize);
  }
  LOG_DEBUG("PatternRegistry", "Compiled " + std::to_string(compiled_.size()) + " pattern(s)");
}

std::vector<PIIPattern> PatternRegistry::Patterns(std::optional<PIIType> type) const {
  if (!type) {
    return patterns_;
  }
  std::vector<PIIPattern> result;
  for (const auto& p : patterns_) {
    if (p.type == *type) {
      result.push_back(p);
    }
  }
  return result;
}

std::vector<CompiledPattern> PatternRegistry::Compiled(std::optional<PIIType> type) const {
  std::vector<CompiledPattern> result;
  result.reserve(patterns_.size());
  for (size_t i = 0; i < patterns_.size(); ++i) {
    if (type && patterns_[i].type != *type) {
      continue;
    }
    result.push_back({&patterns_[i], &compiled_[i]});
  }
  return result;
}

}  // namespace shield
