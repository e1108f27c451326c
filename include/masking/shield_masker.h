#ifndef SHIELD_MASKER_H_
#define SHIELD_MASKER_H_

#include <array>
#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include "core/shield_types.h"

namespace shield {

/**
 * Per-type masking strategy table.
 *
 * Plain value type; the owner (normally the Detector) is responsible for
 * synchronising writes against concurrent reads.
 */
class MaskingConfig {
 public:
  // PARTIAL for cards, SSN, email, phone, names and bank accounts; FULL otherwise
  MaskingConfig();

  static MaskingStrategy DefaultStrategy(PIIType type);

  MaskingStrategy GetStrategy(PIIType type) const;
  void SetStrategy(PIIType type, MaskingStrategy strategy);
  void SetAllStrategies(MaskingStrategy strategy);

  bool operator==(const MaskingConfig& other) const {
    return strategies_ == other.strategies_;
  }

 private:
  std::array<MaskingStrategy, kPIITypeCount> strategies_;
};

/**
 * Masker - turns a PII value into its replacement text
 *
 * Dispatch goes through a table indexed by MaskingStrategy. Everything is
 * stateless except the TOKENIZE counter, which is atomic so one masker can
 * serve concurrent detection calls.
 *
 * Usage:
 *   Masker masker;
 *   masker.Mask("john@example.com", PIIType::EMAIL);   // "j***n@example.com"
 *   masker.Mask("123-45-6789", PIIType::SSN, MaskingStrategy::HASH);
 */
class Masker {
 public:
  explicit Masker(MaskingStrategy default_strategy = MaskingStrategy::PARTIAL);

  Masker(const Masker&) = delete;
  Masker& operator=(const Masker&) = delete;

  std::string Mask(const std::string& value, PIIType type,
                   std::optional<MaskingStrategy> strategy = std::nullopt);

  MaskingStrategy default_strategy() const { return default_strategy_; }

  // Tokens issued so far by this instance
  uint64_t token_count() const { return token_counter_.load(std::memory_order_relaxed); }

  // Strategy implementations
  static std::string MaskFull(const std::string& value, PIIType type);
  static std::string MaskPartial(const std::string& value, PIIType type);
  static std::string MaskRedact(const std::string& value);
  static std::string MaskHash(const std::string& value, PIIType type);
  std::string MaskTokenize(const std::string& value, PIIType type);

  // PARTIAL rules per type
  static std::string MaskCreditCard(const std::string& card);
  static std::string MaskSSN(const std::string& ssn);
  static std::string MaskEmail(const std::string& email);
  static std::string MaskPhone(const std::string& phone);
  static std::string MaskName(const std::string& name);
  static std::string MaskBankAccount(const std::string& account);

  // Lower-case hex SHA-256; empty string if the digest could not be computed
  static std::string Sha256Hex(const std::string& value);

 private:
  using StrategyFn = std::string (*)(Masker&, const std::string&, PIIType);

  static const std::array<StrategyFn, kMaskingStrategyCount>& StrategyTable();

  const MaskingStrategy default_strategy_;
  std::atomic<uint64_t> token_counter_{0};
};

}  // namespace shield

#endif  // SHIELD_MASKER_H_
