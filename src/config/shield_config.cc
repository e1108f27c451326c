#include "config/shield_config.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>

#include "util/logger.h"
#include "util/shield_text_utils.h"

namespace shield {

namespace {

const char kEnvPrefix[] = "PII_SHIELD_";

// ============================================================
// JSON field readers
// ============================================================

bool TypeError(const std::string& key, const char* expected, std::string* error) {
  *error = "Config key '" + key + "' must be " + expected;
  return false;
}

bool Read(const nlohmann::json& obj, const std::string& section, const char* key,
          bool* out, std::string* error) {
  auto it = obj.find(key);
  if (it == obj.end()) return true;
  if (!it->is_boolean()) return TypeError(section + "." + key, "a boolean", error);
  *out = it->get<bool>();
  return true;
}

bool Read(const nlohmann::json& obj, const std::string& section, const char* key,
          double* out, std::string* error) {
  auto it = obj.find(key);
  if (it == obj.end()) return true;
  if (!it->is_number()) return TypeError(section + "." + key, "a number", error);
  *out = it->get<double>();
  return true;
}

bool Read(const nlohmann::json& obj, const std::string& section, const char* key,
          size_t* out, std::string* error) {
  auto it = obj.find(key);
  if (it == obj.end()) return true;
  if (!it->is_number_unsigned()) {
    return TypeError(section + "." + key, "a non-negative integer", error);
  }
  *out = it->get<size_t>();
  return true;
}

bool Read(const nlohmann::json& obj, const std::string& section, const char* key,
          std::string* out, std::string* error) {
  auto it = obj.find(key);
  if (it == obj.end()) return true;
  if (!it->is_string()) return TypeError(section + "." + key, "a string", error);
  *out = it->get<std::string>();
  return true;
}

// ============================================================
// Environment readers
// ============================================================

const char* Env(const char* name) {
  return std::getenv((std::string(kEnvPrefix) + name).c_str());
}

bool EnvError(const char* name, const std::string& value, const char* expected,
              std::string* error) {
  *error = std::string(kEnvPrefix) + name + "='" + value + "' is not " + expected;
  return false;
}

bool ReadEnv(const char* name, bool* out, std::string* error) {
  const char* raw = Env(name);
  if (!raw) return true;
  auto parsed = ParseBool(raw);
  if (!parsed) return EnvError(name, raw, "a boolean", error);
  *out = *parsed;
  return true;
}

bool ReadEnv(const char* name, double* out, std::string* error) {
  const char* raw = Env(name);
  if (!raw) return true;
  char* end = nullptr;
  errno = 0;
  double value = std::strtod(raw, &end);
  if (end == raw || *end != '\0' || errno == ERANGE) {
    return EnvError(name, raw, "a number", error);
  }
  *out = value;
  return true;
}

bool ReadEnv(const char* name, size_t* out, std::string* error) {
  const char* raw = Env(name);
  if (!raw) return true;
  const std::string value = raw;
  if (!text::IsAllDigits(value)) {
    return EnvError(name, value, "a non-negative integer", error);
  }
  errno = 0;
  unsigned long long parsed = std::strtoull(raw, nullptr, 10);
  if (errno == ERANGE) {
    return EnvError(name, value, "in range", error);
  }
  *out = static_cast<size_t>(parsed);
  return true;
}

void ReadEnv(const char* name, std::string* out) {
  const char* raw = Env(name);
  if (raw) {
    *out = raw;
  }
}

bool IsKnownLogLevel(const std::string& name) {
  const std::string lower = text::ToLower(name);
  return lower == "debug" || lower == "info" || lower == "warn" ||
         lower == "warning" || lower == "error";
}

}  // namespace

std::optional<bool> ParseBool(const std::string& value) {
  const std::string lower = text::ToLower(value);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    return true;
  }
  if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    return false;
  }
  return std::nullopt;
}

bool ShieldConfig::LoadFile(const std::string& path, std::string* error) {
  std::ifstream in(path);
  if (!in) {
    *error = "Cannot open config file: " + path;
    return false;
  }

  nlohmann::json root = nlohmann::json::parse(in, nullptr, false);
  if (root.is_discarded()) {
    *error = "Config file is not valid JSON: " + path;
    return false;
  }

  if (!LoadJson(root, error)) {
    *error = path + ": " + *error;
    return false;
  }
  LOG_DEBUG("Config", "Loaded config file " + path);
  return true;
}

bool ShieldConfig::LoadJson(const nlohmann::json& root, std::string* error) {
  if (!root.is_object()) {
    *error = "Config root must be a JSON object";
    return false;
  }

  auto section = root.find("detection");
  if (section != root.end()) {
    if (!section->is_object()) return TypeError("detection", "an object", error);
    const auto& d = *section;
    if (!Read(d, "detection", "default_confidence_threshold",
              &detection.default_confidence_threshold, error) ||
        !Read(d, "detection", "enable_context_validation",
              &detection.enable_context_validation, error) ||
        !Read(d, "detection", "enable_strict_validation",
              &detection.enable_strict_validation, error) ||
        !Read(d, "detection", "collect_statistics", &detection.collect_statistics, error) ||
        !Read(d, "detection", "include_context", &detection.include_context, error) ||
        !Read(d, "detection", "context_window_chars", &detection.context_window_chars, error) ||
        !Read(d, "detection", "legacy_name_offsets", &detection.legacy_name_offsets, error) ||
        !Read(d, "detection", "max_text_length", &detection.max_text_length, error) ||
        !Read(d, "detection", "batch_size_limit", &detection.batch_size_limit, error) ||
        !Read(d, "detection", "batch_workers", &detection.batch_workers, error)) {
      return false;
    }
  }

  section = root.find("masking");
  if (section != root.end()) {
    if (!section->is_object()) return TypeError("masking", "an object", error);

    auto strategy = section->find("default_strategy");
    if (strategy != section->end()) {
      if (!strategy->is_string()) {
        return TypeError("masking.default_strategy", "a string", error);
      }
      auto parsed = ParseStrategy(strategy->get<std::string>());
      if (!parsed) {
        *error = "Unknown masking strategy: " + strategy->get<std::string>();
        return false;
      }
      masking.default_strategy = *parsed;
    }

    auto per_type = section->find("strategies");
    if (per_type != section->end()) {
      if (!per_type->is_object()) {
        return TypeError("masking.strategies", "an object", error);
      }
      for (auto it = per_type->begin(); it != per_type->end(); ++it) {
        auto type = ParseType(it.key());
        if (!type) {
          *error = "Unknown PII type in masking.strategies: " + it.key();
          return false;
        }
        if (!it->is_string()) {
          return TypeError("masking.strategies." + it.key(), "a string", error);
        }
        auto parsed = ParseStrategy(it->get<std::string>());
        if (!parsed) {
          *error = "Unknown masking strategy for " + it.key() + ": " + it->get<std::string>();
          return false;
        }
        masking.overrides[*type] = *parsed;
      }
    }
  }

  section = root.find("logging");
  if (section != root.end()) {
    if (!section->is_object()) return TypeError("logging", "an object", error);
    if (!Read(*section, "logging", "log_level", &logging.log_level, error) ||
        !Read(*section, "logging", "log_file", &logging.log_file, error)) {
      return false;
    }
  }

  return true;
}

bool ShieldConfig::ApplyEnvironment(std::string* error) {
  if (!ReadEnv("CONFIDENCE_THRESHOLD", &detection.default_confidence_threshold, error) ||
      !ReadEnv("ENABLE_CONTEXT_VALIDATION", &detection.enable_context_validation, error) ||
      !ReadEnv("ENABLE_STRICT_VALIDATION", &detection.enable_strict_validation, error) ||
      !ReadEnv("COLLECT_STATISTICS", &detection.collect_statistics, error) ||
      !ReadEnv("INCLUDE_CONTEXT", &detection.include_context, error) ||
      !ReadEnv("CONTEXT_WINDOW", &detection.context_window_chars, error) ||
      !ReadEnv("LEGACY_NAME_OFFSETS", &detection.legacy_name_offsets, error) ||
      !ReadEnv("MAX_TEXT_LENGTH", &detection.max_text_length, error) ||
      !ReadEnv("BATCH_SIZE_LIMIT", &detection.batch_size_limit, error) ||
      !ReadEnv("BATCH_WORKERS", &detection.batch_workers, error)) {
    return false;
  }

  const char* strategy = Env("DEFAULT_STRATEGY");
  if (strategy) {
    auto parsed = ParseStrategy(strategy);
    if (!parsed) {
      return EnvError("DEFAULT_STRATEGY", strategy, "a masking strategy", error);
    }
    masking.default_strategy = *parsed;
  }

  ReadEnv("LOG_LEVEL", &logging.log_level);
  ReadEnv("LOG_FILE", &logging.log_file);
  return true;
}

bool ShieldConfig::Validate(std::string* error) const {
  const double threshold = detection.default_confidence_threshold;
  if (std::isnan(threshold) || threshold < 0.0 || threshold > 1.0) {
    *error = "default_confidence_threshold must be between 0.0 and 1.0";
    return false;
  }
  if (detection.context_window_chars == 0) {
    *error = "context_window_chars must be greater than 0";
    return false;
  }
  if (detection.max_text_length == 0) {
    *error = "max_text_length must be greater than 0";
    return false;
  }
  if (detection.batch_size_limit == 0) {
    *error = "batch_size_limit must be greater than 0";
    return false;
  }
  if (!IsKnownLogLevel(logging.log_level)) {
    *error = "Unknown log_level: " + logging.log_level;
    return false;
  }
  return true;
}

bool ShieldConfig::CheckTextLength(const std::string& text, std::string* error) const {
  if (text.size() > detection.max_text_length) {
    *error = "Text of " + std::to_string(text.size()) + " bytes exceeds max_text_length (" +
             std::to_string(detection.max_text_length) + ")";
    return false;
  }
  return true;
}

nlohmann::json ShieldConfig::ToJson() const {
  nlohmann::json strategies = nlohmann::json::object();
  for (const auto& entry : masking.overrides) {
    strategies[TypeName(entry.first)] = StrategyName(entry.second);
  }

  nlohmann::json masking_json = {{"strategies", strategies}};
  if (masking.default_strategy) {
    masking_json["default_strategy"] = StrategyName(*masking.default_strategy);
  }

  return {
    {"detection", {
      {"default_confidence_threshold", detection.default_confidence_threshold},
      {"enable_context_validation", detection.enable_context_validation},
      {"enable_strict_validation", detection.enable_strict_validation},
      {"collect_statistics", detection.collect_statistics},
      {"include_context", detection.include_context},
      {"context_window_chars", detection.context_window_chars},
      {"legacy_name_offsets", detection.legacy_name_offsets},
      {"max_text_length", detection.max_text_length},
      {"batch_size_limit", detection.batch_size_limit},
      {"batch_workers", detection.batch_workers}
    }},
    {"masking", masking_json},
    {"logging", {
      {"log_level", logging.log_level},
      {"log_file", logging.log_file}
    }}
  };
}

MaskingConfig ShieldConfig::BuildMaskingConfig() const {
  MaskingConfig config;
  if (masking.default_strategy) {
    config.SetAllStrategies(*masking.default_strategy);
  }
  for (const auto& entry : masking.overrides) {
    config.SetStrategy(entry.first, entry.second);
  }
  return config;
}

DetectorOptions ShieldConfig::ToDetectorOptions() const {
  DetectorOptions options;
  options.enable_context_validation = detection.enable_context_validation;
  options.enable_strict_validation = detection.enable_strict_validation;
  options.collect_statistics = detection.collect_statistics;
  options.include_context = detection.include_context;
  options.context_window_chars = detection.context_window_chars;
  options.legacy_name_offsets = detection.legacy_name_offsets;
  return options;
}

bool ShieldConfig::ApplyLogging() const {
  if (logging.log_file.empty()) {
    log::Logger::Init();
  } else {
    log::Logger::Init(logging.log_file);
  }
  return log::Logger::SetLevelFromString(logging.log_level);
}

}  // namespace shield
