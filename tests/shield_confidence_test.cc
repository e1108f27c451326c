#include <gtest/gtest.h>

#include "core/shield_types.h"
#include "detection/shield_confidence.h"

using namespace shield;

TEST(ConfidenceTest, BaseConfidenceUnchanged) {
  EXPECT_DOUBLE_EQ(ConfidenceCalculator::Adjust(0.95, false, true, true), 0.95);
}

TEST(ConfidenceTest, ContextBoostIsCapped) {
  EXPECT_NEAR(ConfidenceCalculator::Adjust(0.75, true, true, true), 0.85, 1e-9);
  EXPECT_DOUBLE_EQ(ConfidenceCalculator::Adjust(0.95, true, true, true), 1.0);
}

TEST(ConfidenceTest, PenaltiesMultiply) {
  EXPECT_NEAR(ConfidenceCalculator::Adjust(0.8, false, false, true), 0.4, 1e-9);
  EXPECT_NEAR(ConfidenceCalculator::Adjust(0.8, false, true, false), 0.56, 1e-9);
  EXPECT_NEAR(ConfidenceCalculator::Adjust(0.8, false, false, false), 0.28, 1e-9);
}

TEST(ConfidenceTest, BoostAppliedBeforePenalties) {
  // (0.95 + 0.1 capped to 1.0) * 0.5
  EXPECT_NEAR(ConfidenceCalculator::Adjust(0.95, true, false, true), 0.5, 1e-9);
}

TEST(ConfidenceTest, ResultClamped) {
  EXPECT_DOUBLE_EQ(ConfidenceCalculator::Adjust(-0.5, false, true, true), 0.0);
  EXPECT_DOUBLE_EQ(ConfidenceCalculator::Adjust(1.5, false, true, true), 1.0);
}

TEST(ConfidenceTest, LengthAppropriate) {
  EXPECT_TRUE(ConfidenceCalculator::IsLengthAppropriate("4111-1111-1111-1111",
                                                        PIIType::CREDIT_CARD));
  EXPECT_FALSE(ConfidenceCalculator::IsLengthAppropriate("4111-1111-1111",
                                                         PIIType::CREDIT_CARD));
  EXPECT_TRUE(ConfidenceCalculator::IsLengthAppropriate("123-45-6789", PIIType::SSN));
  EXPECT_FALSE(ConfidenceCalculator::IsLengthAppropriate("123-45-678", PIIType::SSN));
  EXPECT_TRUE(ConfidenceCalculator::IsLengthAppropriate("x", PIIType::EMAIL));
}
