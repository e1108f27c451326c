#include "masking/shield_masker.h"

#include <cctype>
#include <cstdio>
#include <memory>

#include <openssl/evp.h>

#include "util/logger.h"
#include "util/shield_text_utils.h"

namespace shield {

// ============================================================
// MaskingConfig
// ============================================================

MaskingConfig::MaskingConfig() {
  for (PIIType type : AllTypes()) {
    strategies_[static_cast<size_t>(type)] = DefaultStrategy(type);
  }
}

MaskingStrategy MaskingConfig::DefaultStrategy(PIIType type) {
  switch (type) {
    case PIIType::CREDIT_CARD:
    case PIIType::SSN:
    case PIIType::EMAIL:
    case PIIType::PHONE:
    case PIIType::PERSON_NAME:
    case PIIType::BANK_ACCOUNT:
      return MaskingStrategy::PARTIAL;
    default:
      return MaskingStrategy::FULL;
  }
}

MaskingStrategy MaskingConfig::GetStrategy(PIIType type) const {
  size_t index = static_cast<size_t>(type);
  if (index >= strategies_.size()) {
    return MaskingStrategy::FULL;
  }
  return strategies_[index];
}

void MaskingConfig::SetStrategy(PIIType type, MaskingStrategy strategy) {
  size_t index = static_cast<size_t>(type);
  if (index < strategies_.size()) {
    strategies_[index] = strategy;
  }
}

void MaskingConfig::SetAllStrategies(MaskingStrategy strategy) {
  strategies_.fill(strategy);
}

// ============================================================
// Masker
// ============================================================

Masker::Masker(MaskingStrategy default_strategy)
    : default_strategy_(default_strategy) {}

const std::array<Masker::StrategyFn, kMaskingStrategyCount>& Masker::StrategyTable() {
  // Indexed by MaskingStrategy
  static const std::array<StrategyFn, kMaskingStrategyCount> table = {
    [](Masker&, const std::string& v, PIIType t) { return MaskFull(v, t); },
    [](Masker&, const std::string& v, PIIType t) { return MaskPartial(v, t); },
    [](Masker&, const std::string& v, PIIType) { return MaskRedact(v); },
    [](Masker&, const std::string& v, PIIType t) { return MaskHash(v, t); },
    [](Masker& m, const std::string& v, PIIType t) { return m.MaskTokenize(v, t); },
  };
  return table;
}

std::string Masker::Mask(const std::string& value, PIIType type,
                         std::optional<MaskingStrategy> strategy) {
  size_t index = static_cast<size_t>(strategy.value_or(default_strategy_));
  const auto& table = StrategyTable();
  if (index >= table.size()) {
    return MaskPartial(value, type);
  }
  return table[index](*this, value, type);
}

std::string Masker::MaskFull(const std::string& /*value*/, PIIType type) {
  switch (type) {
    case PIIType::CREDIT_CARD: return "[CREDIT_CARD]";
    case PIIType::SSN: return "[SSN]";
    case PIIType::EMAIL: return "[EMAIL]";
    case PIIType::PHONE: return "[PHONE]";
    case PIIType::PERSON_NAME: return "[NAME]";
    case PIIType::ADDRESS: return "[ADDRESS]";
    case PIIType::IP_ADDRESS: return "[IP_ADDRESS]";
    case PIIType::DATE_OF_BIRTH: return "[DATE_OF_BIRTH]";
    case PIIType::PASSPORT: return "[PASSPORT]";
    case PIIType::DRIVER_LICENSE: return "[DRIVER_LICENSE]";
    case PIIType::BANK_ACCOUNT: return "[BANK_ACCOUNT]";
    case PIIType::TAX_ID: return "[TAX_ID]";
    default: return "[PII]";
  }
}

std::string Masker::MaskPartial(const std::string& value, PIIType type) {
  switch (type) {
    case PIIType::CREDIT_CARD: return MaskCreditCard(value);
    case PIIType::SSN: return MaskSSN(value);
    case PIIType::EMAIL: return MaskEmail(value);
    case PIIType::PHONE: return MaskPhone(value);
    case PIIType::PERSON_NAME: return MaskName(value);
    case PIIType::BANK_ACCOUNT: return MaskBankAccount(value);
    default: return MaskFull(value, type);
  }
}

std::string Masker::MaskRedact(const std::string& value) {
  return std::string(text::Utf8Length(value), '*');
}

std::string Masker::MaskHash(const std::string& value, PIIType type) {
  const std::string digest = Sha256Hex(value);
  if (digest.empty()) {
    LOG_ERROR("Masker", "SHA-256 unavailable, falling back to placeholder for " + TypeName(type));
    return MaskFull(value, type);
  }
  return "[" + TypeName(type) + ":" + digest.substr(0, 12) + "]";
}

std::string Masker::MaskTokenize(const std::string& /*value*/, PIIType type) {
  uint64_t n = token_counter_.fetch_add(1, std::memory_order_relaxed) + 1;
  char counter[24];
  std::snprintf(counter, sizeof(counter), "%04llu", static_cast<unsigned long long>(n));
  return "[" + TypeName(type) + "_TOKEN_" + counter + "]";
}

std::string Masker::MaskCreditCard(const std::string& card) {
  const std::string digits = text::DigitsOnly(card);
  if (digits.size() < 4) {
    return "****";
  }
  return "****-****-****-" + digits.substr(digits.size() - 4);
}

std::string Masker::MaskSSN(const std::string& ssn) {
  const std::string digits = text::DigitsOnly(ssn);
  if (digits.size() < 4) {
    return "***-**-****";
  }
  return "***-**-" + digits.substr(digits.size() - 4);
}

std::string Masker::MaskEmail(const std::string& email) {
  size_t at = email.find('@');
  if (at == std::string::npos || email.find('@', at + 1) != std::string::npos) {
    return "[EMAIL]";
  }

  const std::string user = email.substr(0, at);
  const std::string domain = email.substr(at + 1);

  std::string masked_user;
  if (user.size() <= 2) {
    masked_user = "***";
  } else if (user.size() == 3) {
    masked_user = user.substr(0, 1) + "***";
  } else {
    masked_user = user.substr(0, 1) + "***" + user.substr(user.size() - 1);
  }
  return masked_user + "@" + domain;
}

std::string Masker::MaskPhone(const std::string& phone) {
  const std::string digits = text::DigitsOnly(phone);
  if (digits.size() < 4) {
    return "[PHONE]";
  }
  return "***-***-" + digits.substr(digits.size() - 4);
}

std::string Masker::MaskName(const std::string& name) {
  const auto tokens = text::Tokenize(name);
  if (tokens.empty()) {
    return "[NAME]";
  }

  std::string result;
  for (const auto& token : tokens) {
    if (!result.empty()) {
      result += " ";
    }
    std::string initial = token.word.substr(0, text::FirstCodePointLength(token.word));
    if (initial.size() == 1) {
      initial[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(initial[0])));
    }
    result += initial + "***";
  }
  return result;
}

std::string Masker::MaskBankAccount(const std::string& account) {
  const std::string digits = text::DigitsOnly(account);
  if (digits.size() < 4) {
    return "****";
  }
  return "****" + digits.substr(digits.size() - 4);
}

std::string Masker::Sha256Hex(const std::string& value) {
  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    return "";
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), value.data(), value.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    return "";
  }

  static const char kHex[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    hex.push_back(kHex[digest[i] >> 4]);
    hex.push_back(kHex[digest[i] & 0x0F]);
  }
  return hex;
}

}  // namespace shield
