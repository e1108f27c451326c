#include "detection/shield_statistics.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace shield {

// ============================================================
// DetectionStats
// ============================================================

std::string DetectionStats::ToString() const {
  std::ostringstream ss;
  ss << "Texts processed:     " << total_texts_processed << "\n"
     << "Total detections:    " << total_detections << "\n"
     << "Avg processing time: " << std::fixed << std::setprecision(3)
     << avg_processing_time_ms << " ms\n";
  if (!detections_by_type.empty()) {
    ss << "By type:\n";
    for (const auto& entry : detections_by_type) {
      ss << "  " << std::left << std::setw(16) << TypeName(entry.first)
         << entry.second << "\n";
    }
  }
  return ss.str();
}

nlohmann::json DetectionStats::ToJson() const {
  nlohmann::json by_type = nlohmann::json::object();
  for (const auto& entry : detections_by_type) {
    by_type[TypeName(entry.first)] = entry.second;
  }
  return {
    {"total_detections", total_detections},
    {"detections_by_type", by_type},
    {"total_texts_processed", total_texts_processed},
    {"avg_processing_time_ms", avg_processing_time_ms}
  };
}

// ============================================================
// StatisticsCollector
// ============================================================

void StatisticsCollector::RecordDetection(PIIType type) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++total_detections_;
  ++detections_by_type_[type];
}

void StatisticsCollector::RecordProcessing(double elapsed_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++total_texts_processed_;
  total_processing_time_ms_ += elapsed_ms;
}

DetectionStats StatisticsCollector::GetStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  DetectionStats stats;
  stats.total_detections = total_detections_;
  stats.detections_by_type = detections_by_type_;
  stats.total_texts_processed = total_texts_processed_;
  stats.avg_processing_time_ms = total_texts_processed_ > 0
      ? total_processing_time_ms_ / static_cast<double>(total_texts_processed_)
      : 0.0;
  return stats;
}

void StatisticsCollector::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  total_detections_ = 0;
  detections_by_type_.clear();
  total_texts_processed_ = 0;
  total_processing_time_ms_ = 0.0;
}

// ============================================================
// PerformanceMonitor
// ============================================================

nlohmann::json PerformanceSummary::ToJson() const {
  return {
    {"total_requests", total_requests},
    {"total_matches", total_matches},
    {"avg_time_ms", avg_time_ms},
    {"min_time_ms", min_time_ms},
    {"max_time_ms", max_time_ms},
    {"throughput_per_sec", throughput_per_sec}
  };
}

void PerformanceMonitor::RecordRequest(size_t num_matches, double elapsed_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (total_requests_ == 0) {
    min_time_ms_ = elapsed_ms;
    max_time_ms_ = elapsed_ms;
  } else {
    min_time_ms_ = std::min(min_time_ms_, elapsed_ms);
    max_time_ms_ = std::max(max_time_ms_, elapsed_ms);
  }
  ++total_requests_;
  total_matches_ += num_matches;
  total_time_ms_ += elapsed_ms;
}

PerformanceSummary PerformanceMonitor::GetSummary() const {
  std::lock_guard<std::mutex> lock(mutex_);
  PerformanceSummary summary;
  summary.total_requests = total_requests_;
  summary.total_matches = total_matches_;
  summary.min_time_ms = min_time_ms_;
  summary.max_time_ms = max_time_ms_;
  if (total_requests_ > 0) {
    summary.avg_time_ms = total_time_ms_ / static_cast<double>(total_requests_);
  }
  if (summary.avg_time_ms > 0.0) {
    summary.throughput_per_sec = 1000.0 / summary.avg_time_ms;
  }
  return summary;
}

void PerformanceMonitor::Reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  total_requests_ = 0;
  total_matches_ = 0;
  total_time_ms_ = 0.0;
  min_time_ms_ = 0.0;
  max_time_ms_ = 0.0;
}

}  // namespace shield
