#include <gtest/gtest.h>

#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/shield_types.h"
#include "detection/shield_statistics.h"

using namespace shield;

// ============================================================
// StatisticsCollector
// ============================================================

TEST(StatisticsCollectorTest, StartsEmpty) {
  StatisticsCollector collector;
  DetectionStats stats = collector.GetStats();
  EXPECT_EQ(stats.total_detections, 0u);
  EXPECT_EQ(stats.total_texts_processed, 0u);
  EXPECT_DOUBLE_EQ(stats.avg_processing_time_ms, 0.0);
  EXPECT_TRUE(stats.detections_by_type.empty());
}

TEST(StatisticsCollectorTest, CountsAndAverages) {
  StatisticsCollector collector;
  collector.RecordDetection(PIIType::EMAIL);
  collector.RecordDetection(PIIType::EMAIL);
  collector.RecordDetection(PIIType::SSN);
  collector.RecordProcessing(2.0);
  collector.RecordProcessing(4.0);

  DetectionStats stats = collector.GetStats();
  EXPECT_EQ(stats.total_detections, 3u);
  EXPECT_EQ(stats.detections_by_type[PIIType::EMAIL], 2u);
  EXPECT_EQ(stats.detections_by_type[PIIType::SSN], 1u);
  EXPECT_EQ(stats.total_texts_processed, 2u);
  EXPECT_DOUBLE_EQ(stats.avg_processing_time_ms, 3.0);

  collector.Reset();
  EXPECT_EQ(collector.GetStats().total_detections, 0u);
  EXPECT_TRUE(collector.GetStats().detections_by_type.empty());
}

TEST(StatisticsCollectorTest, ConcurrentRecording) {
  StatisticsCollector collector;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&collector]() {
      for (int i = 0; i < 1000; ++i) {
        collector.RecordDetection(PIIType::PHONE);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(collector.GetStats().total_detections, 4000u);
}

TEST(DetectionStatsTest, ToJsonUsesTypeNames) {
  DetectionStats stats;
  stats.total_detections = 2;
  stats.detections_by_type[PIIType::CREDIT_CARD] = 2;
  stats.total_texts_processed = 1;

  nlohmann::json j = stats.ToJson();
  EXPECT_EQ(j["total_detections"], 2);
  EXPECT_EQ(j["detections_by_type"]["CREDIT_CARD"], 2);
  EXPECT_EQ(j["total_texts_processed"], 1);
}

TEST(DetectionStatsTest, ToStringListsTypes) {
  DetectionStats stats;
  stats.detections_by_type[PIIType::EMAIL] = 5;
  const std::string text = stats.ToString();
  EXPECT_NE(text.find("Total detections"), std::string::npos);
  EXPECT_NE(text.find("EMAIL"), std::string::npos);
}

// ============================================================
// PerformanceMonitor
// ============================================================

TEST(PerformanceMonitorTest, Summary) {
  PerformanceMonitor monitor;
  PerformanceSummary empty = monitor.GetSummary();
  EXPECT_EQ(empty.total_requests, 0u);
  EXPECT_DOUBLE_EQ(empty.min_time_ms, 0.0);
  EXPECT_DOUBLE_EQ(empty.throughput_per_sec, 0.0);

  monitor.RecordRequest(2, 4.0);
  monitor.RecordRequest(1, 1.0);
  monitor.RecordRequest(0, 7.0);

  PerformanceSummary summary = monitor.GetSummary();
  EXPECT_EQ(summary.total_requests, 3u);
  EXPECT_EQ(summary.total_matches, 3u);
  EXPECT_DOUBLE_EQ(summary.avg_time_ms, 4.0);
  EXPECT_DOUBLE_EQ(summary.min_time_ms, 1.0);
  EXPECT_DOUBLE_EQ(summary.max_time_ms, 7.0);
  EXPECT_DOUBLE_EQ(summary.throughput_per_sec, 250.0);

  nlohmann::json j = summary.ToJson();
  EXPECT_EQ(j["total_requests"], 3);

  monitor.Reset();
  EXPECT_EQ(monitor.GetSummary().total_requests, 0u);
}
