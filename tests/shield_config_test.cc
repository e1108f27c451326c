#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>
#include <limits>
#include <string>

#include <nlohmann/json.hpp>

#include "config/shield_config.h"
#include "core/shield_types.h"
#include "util/logger.h"

using namespace shield;

namespace {

const char* const kEnvVars[] = {
  "PII_SHIELD_CONFIDENCE_THRESHOLD", "PII_SHIELD_ENABLE_CONTEXT_VALIDATION",
  "PII_SHIELD_ENABLE_STRICT_VALIDATION", "PII_SHIELD_COLLECT_STATISTICS",
  "PII_SHIELD_INCLUDE_CONTEXT", "PII_SHIELD_CONTEXT_WINDOW",
  "PII_SHIELD_LEGACY_NAME_OFFSETS", "PII_SHIELD_MAX_TEXT_LENGTH",
  "PII_SHIELD_BATCH_SIZE_LIMIT", "PII_SHIELD_BATCH_WORKERS",
  "PII_SHIELD_DEFAULT_STRATEGY", "PII_SHIELD_LOG_LEVEL", "PII_SHIELD_LOG_FILE",
};

std::string WriteTempFile(const std::string& name, const std::string& content) {
  const std::string path = ::testing::TempDir() + name;
  std::ofstream out(path, std::ios::trunc);
  out << content;
  return path;
}

}  // namespace

class ShieldConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearEnv(); }
  void TearDown() override { ClearEnv(); }

  static void ClearEnv() {
    for (const char* name : kEnvVars) {
      unsetenv(name);
    }
  }

  ShieldConfig config_;
  std::string error_;
};

// ============================================================
// Defaults and validation
// ============================================================

TEST_F(ShieldConfigTest, Defaults) {
  EXPECT_DOUBLE_EQ(config_.detection.default_confidence_threshold, 0.7);
  EXPECT_TRUE(config_.detection.enable_context_validation);
  EXPECT_FALSE(config_.detection.include_context);
  EXPECT_EQ(config_.detection.max_text_length, 1000000u);
  EXPECT_EQ(config_.detection.batch_size_limit, 100u);
  EXPECT_FALSE(config_.masking.default_strategy.has_value());
  EXPECT_EQ(config_.logging.log_level, "INFO");
  EXPECT_TRUE(config_.Validate(&error_)) << error_;
}

TEST_F(ShieldConfigTest, ValidateRanges) {
  config_.detection.default_confidence_threshold = 1.5;
  EXPECT_FALSE(config_.Validate(&error_));
  EXPECT_NE(error_.find("default_confidence_threshold"), std::string::npos);

  config_.detection.default_confidence_threshold = std::numeric_limits<double>::quiet_NaN();
  EXPECT_FALSE(config_.Validate(&error_));

  config_ = ShieldConfig();
  config_.detection.context_window_chars = 0;
  EXPECT_FALSE(config_.Validate(&error_));

  config_ = ShieldConfig();
  config_.detection.batch_size_limit = 0;
  EXPECT_FALSE(config_.Validate(&error_));

  config_ = ShieldConfig();
  config_.logging.log_level = "verbose";
  EXPECT_FALSE(config_.Validate(&error_));

  config_.logging.log_level = "warning";
  EXPECT_TRUE(config_.Validate(&error_)) << error_;
}

// ============================================================
// JSON
// ============================================================

TEST_F(ShieldConfigTest, LoadJson) {
  nlohmann::json root = {
    {"detection", {
      {"default_confidence_threshold", 0.8},
      {"include_context", true},
      {"context_window_chars", 20},
      {"batch_workers", 3},
      {"unknown_key", "ignored"}
    }},
    {"masking", {
      {"default_strategy", "redact"},
      {"strategies", {{"EMAIL", "HASH"}, {"ssn", "FULL"}}}
    }},
    {"logging", {{"log_level", "DEBUG"}}},
    {"extra_section", 1}
  };

  ASSERT_TRUE(config_.LoadJson(root, &error_)) << error_;
  EXPECT_DOUBLE_EQ(config_.detection.default_confidence_threshold, 0.8);
  EXPECT_TRUE(config_.detection.include_context);
  EXPECT_EQ(config_.detection.context_window_chars, 20u);
  EXPECT_EQ(config_.detection.batch_workers, 3u);
  EXPECT_EQ(config_.masking.default_strategy, MaskingStrategy::REDACT);
  EXPECT_EQ(config_.masking.overrides.at(PIIType::EMAIL), MaskingStrategy::HASH);
  EXPECT_EQ(config_.masking.overrides.at(PIIType::SSN), MaskingStrategy::FULL);
  EXPECT_EQ(config_.logging.log_level, "DEBUG");
}

TEST_F(ShieldConfigTest, LoadJsonTypeErrors) {
  EXPECT_FALSE(config_.LoadJson({{"detection", {{"include_context", "yes"}}}}, &error_));
  EXPECT_EQ(error_, "Config key 'detection.include_context' must be a boolean");

  EXPECT_FALSE(config_.LoadJson({{"detection", {{"max_text_length", -5}}}}, &error_));
  EXPECT_NE(error_.find("non-negative integer"), std::string::npos);

  EXPECT_FALSE(config_.LoadJson({{"masking", {{"default_strategy", "SCRAMBLE"}}}}, &error_));
  EXPECT_NE(error_.find("SCRAMBLE"), std::string::npos);

  EXPECT_FALSE(config_.LoadJson({{"masking", {{"strategies", {{"NAME", "FULL"}}}}}}, &error_));
  EXPECT_NE(error_.find("NAME"), std::string::npos);

  EXPECT_FALSE(config_.LoadJson(nlohmann::json::array(), &error_));
  EXPECT_FALSE(config_.LoadJson({{"logging", 5}}, &error_));
}

TEST_F(ShieldConfigTest, ToJsonRoundTrip) {
  config_.detection.default_confidence_threshold = 0.9;
  config_.detection.legacy_name_offsets = true;
  config_.masking.default_strategy = MaskingStrategy::FULL;
  config_.masking.overrides[PIIType::PHONE] = MaskingStrategy::TOKENIZE;
  config_.logging.log_file = "/tmp/shield.log";

  ShieldConfig copy;
  ASSERT_TRUE(copy.LoadJson(config_.ToJson(), &error_)) << error_;
  EXPECT_EQ(copy.ToJson(), config_.ToJson());
  EXPECT_TRUE(copy.detection.legacy_name_offsets);
  EXPECT_EQ(copy.masking.overrides.at(PIIType::PHONE), MaskingStrategy::TOKENIZE);
}

TEST_F(ShieldConfigTest, LoadFile) {
  const std::string path = WriteTempFile("shield_config_test.json", R"({
    "detection": { "default_confidence_threshold": 0.6, "collect_statistics": false },
    "logging": { "log_level": "ERROR" }
  })");

  ASSERT_TRUE(config_.LoadFile(path, &error_)) << error_;
  EXPECT_DOUBLE_EQ(config_.detection.default_confidence_threshold, 0.6);
  EXPECT_FALSE(config_.detection.collect_statistics);
  EXPECT_EQ(config_.logging.log_level, "ERROR");
}

TEST_F(ShieldConfigTest, LoadFileErrors) {
  EXPECT_FALSE(config_.LoadFile(::testing::TempDir() + "does_not_exist.json", &error_));
  EXPECT_NE(error_.find("Cannot open config file"), std::string::npos);

  const std::string bad = WriteTempFile("shield_config_bad.json", "{ not json");
  EXPECT_FALSE(config_.LoadFile(bad, &error_));
  EXPECT_NE(error_.find("not valid JSON"), std::string::npos);

  const std::string wrong = WriteTempFile("shield_config_wrong.json",
                                          R"({"detection": {"context_window_chars": "wide"}})");
  EXPECT_FALSE(config_.LoadFile(wrong, &error_));
  EXPECT_EQ(error_.find(wrong), 0u);
}

// ============================================================
// Environment
// ============================================================

TEST_F(ShieldConfigTest, EnvironmentOverridesFile) {
  ASSERT_TRUE(config_.LoadJson({{"detection", {{"default_confidence_threshold", 0.6}}}},
                               &error_));

  setenv("PII_SHIELD_CONFIDENCE_THRESHOLD", "0.85", 1);
  setenv("PII_SHIELD_INCLUDE_CONTEXT", "yes", 1);
  setenv("PII_SHIELD_ENABLE_STRICT_VALIDATION", "off", 1);
  setenv("PII_SHIELD_MAX_TEXT_LENGTH", "5000", 1);
  setenv("PII_SHIELD_DEFAULT_STRATEGY", "hash", 1);
  setenv("PII_SHIELD_LOG_LEVEL", "warn", 1);

  ASSERT_TRUE(config_.ApplyEnvironment(&error_)) << error_;
  EXPECT_DOUBLE_EQ(config_.detection.default_confidence_threshold, 0.85);
  EXPECT_TRUE(config_.detection.include_context);
  EXPECT_FALSE(config_.detection.enable_strict_validation);
  EXPECT_EQ(config_.detection.max_text_length, 5000u);
  EXPECT_EQ(config_.masking.default_strategy, MaskingStrategy::HASH);
  EXPECT_EQ(config_.logging.log_level, "warn");
}

TEST_F(ShieldConfigTest, EnvironmentErrors) {
  setenv("PII_SHIELD_COLLECT_STATISTICS", "maybe", 1);
  EXPECT_FALSE(config_.ApplyEnvironment(&error_));
  EXPECT_NE(error_.find("PII_SHIELD_COLLECT_STATISTICS"), std::string::npos);
  unsetenv("PII_SHIELD_COLLECT_STATISTICS");

  setenv("PII_SHIELD_CONFIDENCE_THRESHOLD", "high", 1);
  EXPECT_FALSE(config_.ApplyEnvironment(&error_));
  unsetenv("PII_SHIELD_CONFIDENCE_THRESHOLD");

  setenv("PII_SHIELD_BATCH_SIZE_LIMIT", "-1", 1);
  EXPECT_FALSE(config_.ApplyEnvironment(&error_));
  unsetenv("PII_SHIELD_BATCH_SIZE_LIMIT");

  setenv("PII_SHIELD_DEFAULT_STRATEGY", "SCRAMBLE", 1);
  EXPECT_FALSE(config_.ApplyEnvironment(&error_));
}

TEST_F(ShieldConfigTest, EnvironmentUnsetLeavesValues) {
  config_.detection.context_window_chars = 12;
  ASSERT_TRUE(config_.ApplyEnvironment(&error_)) << error_;
  EXPECT_EQ(config_.detection.context_window_chars, 12u);
}

// ============================================================
// Conversions
// ============================================================

TEST_F(ShieldConfigTest, BuildMaskingConfig) {
  EXPECT_TRUE(config_.BuildMaskingConfig() == MaskingConfig());

  config_.masking.default_strategy = MaskingStrategy::FULL;
  config_.masking.overrides[PIIType::EMAIL] = MaskingStrategy::PARTIAL;
  MaskingConfig masking = config_.BuildMaskingConfig();
  EXPECT_EQ(masking.GetStrategy(PIIType::EMAIL), MaskingStrategy::PARTIAL);
  EXPECT_EQ(masking.GetStrategy(PIIType::SSN), MaskingStrategy::FULL);
  EXPECT_EQ(masking.GetStrategy(PIIType::PERSON_NAME), MaskingStrategy::FULL);
}

TEST_F(ShieldConfigTest, ToDetectorOptions) {
  config_.detection.enable_context_validation = false;
  config_.detection.include_context = true;
  config_.detection.context_window_chars = 10;
  config_.detection.legacy_name_offsets = true;

  DetectorOptions options = config_.ToDetectorOptions();
  EXPECT_FALSE(options.enable_context_validation);
  EXPECT_TRUE(options.enable_strict_validation);
  EXPECT_TRUE(options.include_context);
  EXPECT_EQ(options.context_window_chars, 10u);
  EXPECT_TRUE(options.legacy_name_offsets);
}

TEST_F(ShieldConfigTest, CheckTextLengthRefusesOversizedText) {
  config_.detection.max_text_length = 8;
  EXPECT_TRUE(config_.CheckTextLength("12345678", &error_));
  EXPECT_FALSE(config_.CheckTextLength("123456789", &error_));
  EXPECT_NE(error_.find("max_text_length"), std::string::npos) << error_;
}

TEST_F(ShieldConfigTest, ApplyLogging) {
  config_.logging.log_level = "error";
  EXPECT_TRUE(config_.ApplyLogging());
  EXPECT_EQ(log::Logger::GetLevel(), log::ERROR);

  config_.logging.log_level = "loud";
  EXPECT_FALSE(config_.ApplyLogging());

  log::Logger::Init();
  log::Logger::SetLevel(log::INFO);
}

TEST(ParseBoolTest, AcceptedSpellings) {
  EXPECT_EQ(ParseBool("true"), true);
  EXPECT_EQ(ParseBool("YES"), true);
  EXPECT_EQ(ParseBool("1"), true);
  EXPECT_EQ(ParseBool("On"), true);
  EXPECT_EQ(ParseBool("false"), false);
  EXPECT_EQ(ParseBool("no"), false);
  EXPECT_EQ(ParseBool("0"), false);
  EXPECT_EQ(ParseBool("OFF"), false);
  EXPECT_FALSE(ParseBool("maybe").has_value());
  EXPECT_FALSE(ParseBool("").has_value());
}
