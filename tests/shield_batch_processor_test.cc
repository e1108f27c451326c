#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "core/shield_types.h"
#include "detection/shield_batch_processor.h"
#include "detection/shield_detector.h"

using namespace shield;

class BatchProcessorTest : public ::testing::Test {
 protected:
  Detector detector_;
};

TEST_F(BatchProcessorTest, ResultsInInputOrder) {
  BatchProcessor batch(detector_, 10, 2);
  EXPECT_EQ(batch.worker_count(), 2u);
  EXPECT_EQ(batch.batch_size_limit(), 10u);

  const std::vector<std::string> texts = {
    "Mail john@example.com",
    "Nothing here",
    "SSN 123-45-6789 and IP 10.0.0.1",
  };

  std::vector<std::vector<PIIMatch>> results;
  std::string error;
  ASSERT_TRUE(batch.ProcessBatch(texts, 0.7, &results, &error)) << error;
  ASSERT_EQ(results.size(), 3u);

  ASSERT_EQ(results[0].size(), 1u);
  EXPECT_EQ(results[0][0].type, PIIType::EMAIL);
  EXPECT_TRUE(results[1].empty());
  ASSERT_EQ(results[2].size(), 2u);
  EXPECT_EQ(results[2][0].type, PIIType::SSN);
  EXPECT_EQ(results[2][1].type, PIIType::IP_ADDRESS);
}

TEST_F(BatchProcessorTest, MatchesSequentialDetection) {
  BatchProcessor batch(detector_, 50, 4);
  std::vector<std::string> texts;
  for (int i = 0; i < 40; ++i) {
    texts.push_back("User " + std::to_string(i) + " mail user" + std::to_string(i) +
                    "@example.com");
  }

  std::vector<std::vector<PIIMatch>> results;
  std::string error;
  ASSERT_TRUE(batch.ProcessBatch(texts, 0.7, &results, &error)) << error;
  ASSERT_EQ(results.size(), texts.size());
  for (size_t i = 0; i < texts.size(); ++i) {
    auto expected = detector_.Detect(texts[i]);
    ASSERT_EQ(results[i].size(), expected.size()) << texts[i];
    for (size_t k = 0; k < expected.size(); ++k) {
      EXPECT_EQ(results[i][k].value, expected[k].value);
    }
  }
}

TEST_F(BatchProcessorTest, RejectsOversizedBatch) {
  BatchProcessor batch(detector_, 2, 1);
  std::vector<std::vector<PIIMatch>> results = {{}};
  std::string error;

  EXPECT_FALSE(batch.ProcessBatch({"a", "b", "c"}, 0.7, &results, &error));
  EXPECT_NE(error.find("exceeds limit of 2"), std::string::npos) << error;
  EXPECT_TRUE(results.empty());
  EXPECT_EQ(batch.GetPerformance().total_requests, 0u);
}

TEST_F(BatchProcessorTest, EmptyBatch) {
  BatchProcessor batch(detector_);
  EXPECT_EQ(batch.batch_size_limit(), BatchProcessor::kDefaultBatchSizeLimit);
  EXPECT_GE(batch.worker_count(), 1u);

  std::vector<std::vector<PIIMatch>> results;
  std::string error;
  EXPECT_TRUE(batch.ProcessBatch({}, 0.7, &results, &error));
  EXPECT_TRUE(results.empty());
}

TEST_F(BatchProcessorTest, PerformanceAndStatistics) {
  BatchProcessor batch(detector_, 10, 2);
  std::vector<std::vector<PIIMatch>> results;
  std::string error;
  ASSERT_TRUE(batch.ProcessBatch({"a1@x.com", "b2@y.com and c3@z.com", "none"}, 0.7,
                                 &results, &error));

  PerformanceSummary perf = batch.GetPerformance();
  EXPECT_EQ(perf.total_requests, 3u);
  EXPECT_EQ(perf.total_matches, 3u);
  EXPECT_LE(perf.min_time_ms, perf.max_time_ms);

  auto stats = detector_.GetStatistics();
  ASSERT_TRUE(stats.has_value());
  EXPECT_EQ(stats->total_texts_processed, 3u);
  EXPECT_EQ(stats->total_detections, 3u);
}
