#ifndef SHIELD_REVERSIBLE_MASKER_H_
#define SHIELD_REVERSIBLE_MASKER_H_

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "core/shield_types.h"

namespace shield {

/**
 * ReversibleMasker - token vault for tests and debugging
 *
 * NOT SAFE FOR PRODUCTION USE. Every original value is kept in memory and
 * can be recovered from its token, which defeats the point of masking.
 * It is deliberately not a MaskingStrategy so it cannot be selected from
 * configuration.
 *
 * Tokens look like [EMAIL_0001]; the counter is shared by all types.
 */
class ReversibleMasker {
 public:
  ReversibleMasker();

  ReversibleMasker(const ReversibleMasker&) = delete;
  ReversibleMasker& operator=(const ReversibleMasker&) = delete;

  std::string Mask(const std::string& value, PIIType type);

  // nullopt if the token was never issued or the mapping was cleared
  std::optional<std::string> Unmask(const std::string& token) const;

  // Replace every known token occurring in `text` with its original value
  std::string UnmaskText(const std::string& text) const;

  // Forget all tokens and restart numbering
  void ClearMapping();

  size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string> token_to_original_;
  uint64_t counter_ = 0;
};

}  // namespace shield

#endif  // SHIELD_REVERSIBLE_MASKER_H_
