#include "core/shield_types.h"

#include <algorithm>
#include <cctype>

namespace shield {

namespace {

std::string ToUpper(const std::string& s) {
  std::string out = s;
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

}  // namespace

const std::array<PIIType, kPIITypeCount>& AllTypes() {
  static const std::array<PIIType, kPIITypeCount> kTypes = {
    PIIType::CREDIT_CARD, PIIType::SSN, PIIType::EMAIL, PIIType::PHONE,
    PIIType::PERSON_NAME, PIIType::ADDRESS, PIIType::IP_ADDRESS,
    PIIType::DATE_OF_BIRTH, PIIType::PASSPORT, PIIType::DRIVER_LICENSE,
    PIIType::BANK_ACCOUNT, PIIType::TAX_ID
  };
  return kTypes;
}

std::string TypeName(PIIType type) {
  switch (type) {
    case PIIType::CREDIT_CARD: return "CREDIT_CARD";
    case PIIType::SSN: return "SSN";
    case PIIType::EMAIL: return "EMAIL";
    case PIIType::PHONE: return "PHONE";
    case PIIType::PERSON_NAME: return "PERSON_NAME";
    case PIIType::ADDRESS: return "ADDRESS";
    case PIIType::IP_ADDRESS: return "IP_ADDRESS";
    case PIIType::DATE_OF_BIRTH: return "DATE_OF_BIRTH";
    case PIIType::PASSPORT: return "PASSPORT";
    case PIIType::DRIVER_LICENSE: return "DRIVER_LICENSE";
    case PIIType::BANK_ACCOUNT: return "BANK_ACCOUNT";
    case PIIType::TAX_ID: return "TAX_ID";
    default: return "UNKNOWN";
  }
}

std::string TypeDescription(PIIType type) {
  switch (type) {
    case PIIType::CREDIT_CARD: return "Credit card numbers (Visa, Mastercard, Amex, Discover)";
    case PIIType::SSN: return "US Social Security Numbers";
    case PIIType::EMAIL: return "Email addresses";
    case PIIType::PHONE: return "Phone numbers (US and international)";
    case PIIType::PERSON_NAME: return "Person names";
    case PIIType::ADDRESS: return "Street addresses";
    case PIIType::IP_ADDRESS: return "IPv4 addresses";
    case PIIType::DATE_OF_BIRTH: return "Dates of birth";
    case PIIType::PASSPORT: return "Passport numbers";
    case PIIType::DRIVER_LICENSE: return "Driver license numbers";
    case PIIType::BANK_ACCOUNT: return "Bank account numbers";
    case PIIType::TAX_ID: return "Tax identification numbers";
    default: return "Unknown";
  }
}

std::optional<PIIType> ParseType(const std::string& name) {
  const std::string upper = ToUpper(name);
  for (PIIType type : AllTypes()) {
    if (TypeName(type) == upper) {
      return type;
    }
  }
  return std::nullopt;
}

std::string StrategyName(MaskingStrategy strategy) {
  switch (strategy) {
    case MaskingStrategy::FULL: return "FULL";
    case MaskingStrategy::PARTIAL: return "PARTIAL";
    case MaskingStrategy::REDACT: return "REDACT";
    case MaskingStrategy::HASH: return "HASH";
    case MaskingStrategy::TOKENIZE: return "TOKENIZE";
    default: return "UNKNOWN";
  }
}

std::optional<MaskingStrategy> ParseStrategy(const std::string& name) {
  const std::string upper = ToUpper(name);
  if (upper == "FULL") return MaskingStrategy::FULL;
  if (upper == "PARTIAL") return MaskingStrategy::PARTIAL;
  if (upper == "REDACT") return MaskingStrategy::REDACT;
  if (upper == "HASH") return MaskingStrategy::HASH;
  if (upper == "TOKENIZE") return MaskingStrategy::TOKENIZE;
  return std::nullopt;
}

}  // namespace shield
