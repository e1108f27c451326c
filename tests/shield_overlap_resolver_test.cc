#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/shield_types.h"
#include "detection/shield_overlap_resolver.h"

using namespace shield;

namespace {

PIIMatch MakeMatch(PIIType type, size_t start, size_t end, double confidence) {
  PIIMatch m;
  m.type = type;
  m.start = start;
  m.end = end;
  m.confidence = confidence;
  m.value = std::string(end - start, 'x');
  return m;
}

}  // namespace

TEST(OverlapResolverTest, EmptyInput) {
  EXPECT_TRUE(OverlapResolver::Resolve({}).empty());
}

TEST(OverlapResolverTest, DisjointSpansAreSortedByStart) {
  auto result = OverlapResolver::Resolve({
    MakeMatch(PIIType::EMAIL, 20, 30, 0.9),
    MakeMatch(PIIType::SSN, 0, 10, 0.9),
    MakeMatch(PIIType::PHONE, 10, 20, 0.8),  // touching, not overlapping
  });
  ASSERT_EQ(result.size(), 3u);
  EXPECT_EQ(result[0].start, 0u);
  EXPECT_EQ(result[1].start, 10u);
  EXPECT_EQ(result[2].start, 20u);
}

TEST(OverlapResolverTest, HigherConfidenceWins) {
  auto result = OverlapResolver::Resolve({
    MakeMatch(PIIType::PHONE, 5, 19, 0.80),
    MakeMatch(PIIType::CREDIT_CARD, 5, 24, 0.95),
  });
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result[0].type, PIIType::CREDIT_CARD);
}

TEST(OverlapResolverTest, LaterSpanReplacesWeakerEarlierSpan) {
  auto result = OverlapResolver::Resolve({
    MakeMatch(PIIType::BANK_ACCOUNT, 0, 10, 0.5),
    MakeMatch(PIIType::SSN, 5, 15, 0.98),
  });
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result[0].type, PIIType::SSN);
}

TEST(OverlapResolverTest, TieKeepsFirstAccepted) {
  auto result = OverlapResolver::Resolve({
    MakeMatch(PIIType::PERSON_NAME, 0, 10, 0.75),
    MakeMatch(PIIType::ADDRESS, 4, 12, 0.75),
  });
  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result[0].type, PIIType::PERSON_NAME);
}

TEST(OverlapResolverTest, OutputNeverOverlaps) {
  auto result = OverlapResolver::Resolve({
    MakeMatch(PIIType::EMAIL, 0, 8, 0.6),
    MakeMatch(PIIType::PHONE, 3, 12, 0.7),
    MakeMatch(PIIType::SSN, 10, 20, 0.9),
    MakeMatch(PIIType::TAX_ID, 18, 25, 0.5),
    MakeMatch(PIIType::IP_ADDRESS, 30, 40, 0.9),
  });
  ASSERT_FALSE(result.empty());
  for (size_t i = 1; i < result.size(); ++i) {
    EXPECT_LE(result[i - 1].end, result[i].start);
  }
}

TEST(OverlapResolverTest, Overlaps) {
  auto a = MakeMatch(PIIType::EMAIL, 0, 10, 0.9);
  EXPECT_TRUE(OverlapResolver::Overlaps(a, MakeMatch(PIIType::EMAIL, 9, 12, 0.9)));
  EXPECT_FALSE(OverlapResolver::Overlaps(a, MakeMatch(PIIType::EMAIL, 10, 12, 0.9)));
}
