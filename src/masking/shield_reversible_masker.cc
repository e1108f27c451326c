#include "masking/shield_reversible_masker.h"

#include <cstdio>

#include "util/logger.h"

namespace shield {

ReversibleMasker::ReversibleMasker() {
  LOG_WARN("ReversibleMasker", "Reversible masking keeps original values in memory; "
                               "use for testing and debugging only");
}

std::string ReversibleMasker::Mask(const std::string& value, PIIType type) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++counter_;

  char counter[24];
  std::snprintf(counter, sizeof(counter), "%04llu", static_cast<unsigned long long>(counter_));
  std::string token = "[" + TypeName(type) + "_" + counter + "]";

  token_to_original_[token] = value;
  return token;
}

std::optional<std::string> ReversibleMasker::Unmask(const std::string& token) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = token_to_original_.find(token);
  if (it == token_to_original_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string ReversibleMasker::UnmaskText(const std::string& text) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::string result = text;
  for (const auto& entry : token_to_original_) {
    const std::string& token = entry.first;
    size_t pos = 0;
    while ((pos = result.find(token, pos)) != std::string::npos) {
      result.replace(pos, token.size(), entry.second);
      pos += entry.second.size();
    }
  }
  return result;
}

void ReversibleMasker::ClearMapping() {
  std::lock_guard<std::mutex> lock(mutex_);
  token_to_original_.clear();
  counter_ = 0;
}

size_t ReversibleMasker::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return token_to_original_.size();
}

}  // namespace shield
