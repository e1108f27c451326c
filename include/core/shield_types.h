#ifndef SHIELD_TYPES_H_
#define SHIELD_TYPES_H_

#include <array>
#include <cstddef>
#include <optional>
#include <string>

namespace shield {

/**
 * Closed set of PII categories the engine can report.
 * Values are contiguous so they can index fixed-size tables.
 */
enum class PIIType {
  CREDIT_CARD = 0,
  SSN,
  EMAIL,
  PHONE,
  PERSON_NAME,
  ADDRESS,
  IP_ADDRESS,
  DATE_OF_BIRTH,
  PASSPORT,
  DRIVER_LICENSE,
  BANK_ACCOUNT,
  TAX_ID
};

constexpr size_t kPIITypeCount = 12;

/**
 * How a confirmed PII value is turned into its safe replacement.
 */
enum class MaskingStrategy {
  FULL = 0,   // Fixed per-type placeholder, e.g. [EMAIL]
  PARTIAL,    // Type-specific partial reveal, e.g. last four digits
  REDACT,     // Every character replaced with '*'
  HASH,       // [TYPE:<12 hex chars of SHA-256>]
  TOKENIZE    // [TYPE_TOKEN_0001], counter per masker
};

constexpr size_t kMaskingStrategyCount = 5;

/**
 * One detected PII span.
 *
 * [start, end) are byte offsets into the exact text passed to Detect();
 * text.substr(start, end - start) == value always holds.
 */
struct PIIMatch {
  PIIType type = PIIType::EMAIL;
  std::string value;
  size_t start = 0;
  size_t end = 0;
  double confidence = 0.0;
  std::string masked_value;
  std::optional<std::string> context;

  size_t length() const { return end - start; }
};

// All types in declaration order
const std::array<PIIType, kPIITypeCount>& AllTypes();

// Upper-case wire name, e.g. "CREDIT_CARD"
std::string TypeName(PIIType type);

// Human readable description used by the "types" listing
std::string TypeDescription(PIIType type);

// Case-insensitive; returns nullopt for unknown names
std::optional<PIIType> ParseType(const std::string& name);

std::string StrategyName(MaskingStrategy strategy);
std::optional<MaskingStrategy> ParseStrategy(const std::string& name);

}  // namespace shield

#endif  // SHIELD_TYPES_H_
