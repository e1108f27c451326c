#ifndef SHIELD_CONFIG_H_
#define SHIELD_CONFIG_H_

#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/shield_types.h"
#include "detection/shield_detector.h"
#include "masking/shield_masker.h"

namespace shield {

struct DetectionSettings {
  double default_confidence_threshold = 0.7;
  bool enable_context_validation = true;
  bool enable_strict_validation = true;
  bool collect_statistics = true;
  bool include_context = false;
  size_t context_window_chars = 50;
  bool legacy_name_offsets = false;
  size_t max_text_length = 1000000;   // 1MB, longest text accepted
  size_t batch_size_limit = 100;
  size_t batch_workers = 0;           // 0 = hardware concurrency
};

struct MaskingSettings {
  // When set, applied to every type before the per-type overrides.
  // When unset, the built-in per-type defaults are used.
  std::optional<MaskingStrategy> default_strategy;
  std::map<PIIType, MaskingStrategy> overrides;
};

struct LoggingSettings {
  std::string log_level = "INFO";
  std::string log_file;               // empty = stderr only
};

/**
 * ShieldConfig - settings for the engine and the command-line tool
 *
 * Priority order: CLI args > Environment variables > Config file > Defaults
 *
 * Config file (JSON):
 *   {
 *     "detection": { "default_confidence_threshold": 0.8, ... },
 *     "masking":   { "default_strategy": "PARTIAL",
 *                    "strategies": { "EMAIL": "HASH" } },
 *     "logging":   { "log_level": "DEBUG", "log_file": "/tmp/shield.log" }
 *   }
 * Unknown keys are ignored. A value of the wrong type fails the load.
 *
 * Environment variables:
 *   PII_SHIELD_CONFIDENCE_THRESHOLD      - detection threshold (default: 0.7)
 *   PII_SHIELD_ENABLE_CONTEXT_VALIDATION - true/false (default: true)
 *   PII_SHIELD_ENABLE_STRICT_VALIDATION  - true/false (default: true)
 *   PII_SHIELD_COLLECT_STATISTICS        - true/false (default: true)
 *   PII_SHIELD_INCLUDE_CONTEXT           - true/false (default: false)
 *   PII_SHIELD_CONTEXT_WINDOW            - context snippet width (default: 50)
 *   PII_SHIELD_LEGACY_NAME_OFFSETS       - true/false (default: false)
 *   PII_SHIELD_MAX_TEXT_LENGTH           - longest text accepted, in bytes (default: 1000000)
 *   PII_SHIELD_BATCH_SIZE_LIMIT          - max texts per batch (default: 100)
 *   PII_SHIELD_BATCH_WORKERS             - batch worker threads (default: 0 = auto)
 *   PII_SHIELD_DEFAULT_STRATEGY          - FULL, PARTIAL, REDACT, HASH, TOKENIZE
 *   PII_SHIELD_LOG_LEVEL                 - DEBUG, INFO, WARN, ERROR (default: INFO)
 *   PII_SHIELD_LOG_FILE                  - append log lines to this file
 */
struct ShieldConfig {
  DetectionSettings detection;
  MaskingSettings masking;
  LoggingSettings logging;

  // Each loader returns false and fills `error` on failure; fields read
  // before the failing one may already have been applied.
  bool LoadFile(const std::string& path, std::string* error);
  bool LoadJson(const nlohmann::json& root, std::string* error);
  bool ApplyEnvironment(std::string* error);

  // Range checks; returns false with a message on the first violation
  bool Validate(std::string* error) const;

  // Oversized texts are refused whole, never scanned in part
  bool CheckTextLength(const std::string& text, std::string* error) const;

  nlohmann::json ToJson() const;

  MaskingConfig BuildMaskingConfig() const;
  DetectorOptions ToDetectorOptions() const;

  // Configure the process logger; false if the level name is unknown
  bool ApplyLogging() const;
};

// "true"/"false", "1"/"0", "yes"/"no", "on"/"off" (any case)
std::optional<bool> ParseBool(const std::string& value);

}  // namespace shield

#endif  // SHIELD_CONFIG_H_
