#ifndef SHIELD_STATISTICS_H_
#define SHIELD_STATISTICS_H_

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

#include "core/shield_types.h"

namespace shield {

// Snapshot of a detector's counters
struct DetectionStats {
  uint64_t total_detections = 0;
  std::map<PIIType, uint64_t> detections_by_type;
  uint64_t total_texts_processed = 0;
  double avg_processing_time_ms = 0.0;

  std::string ToString() const;
  nlohmann::json ToJson() const;
};

/**
 * StatisticsCollector - in-memory detection counters
 *
 * One collector belongs to one Detector. All methods lock, so a detector
 * shared between threads still produces exact counts.
 */
class StatisticsCollector {
 public:
  void RecordDetection(PIIType type);
  void RecordProcessing(double elapsed_ms);

  DetectionStats GetStats() const;
  void Reset();

 private:
  mutable std::mutex mutex_;
  uint64_t total_detections_ = 0;
  std::map<PIIType, uint64_t> detections_by_type_;
  uint64_t total_texts_processed_ = 0;
  double total_processing_time_ms_ = 0.0;
};

struct PerformanceSummary {
  uint64_t total_requests = 0;
  uint64_t total_matches = 0;
  double avg_time_ms = 0.0;
  double min_time_ms = 0.0;       // 0 until the first request
  double max_time_ms = 0.0;
  double throughput_per_sec = 0.0;

  nlohmann::json ToJson() const;
};

/**
 * PerformanceMonitor - request level timing for the command-line tool and
 * batch runs. Thread-safe.
 */
class PerformanceMonitor {
 public:
  void RecordRequest(size_t num_matches, double elapsed_ms);
  PerformanceSummary GetSummary() const;
  void Reset();

 private:
  mutable std::mutex mutex_;
  uint64_t total_requests_ = 0;
  uint64_t total_matches_ = 0;
  double total_time_ms_ = 0.0;
  double min_time_ms_ = 0.0;
  double max_time_ms_ = 0.0;
};

}  // namespace shield

#endif  // SHIELD_STATISTICS_H_
