#include "detection/shield_batch_processor.h"

#include <chrono>
#include <exception>
#include <future>

#include "util/logger.h"

namespace shield {

BatchProcessor::BatchProcessor(Detector& detector, size_t batch_size_limit, size_t num_workers)
    : detector_(detector),
      batch_size_limit_(batch_size_limit),
      pool_(num_workers) {
  LOG_DEBUG("BatchProcessor", "Started " + std::to_string(pool_.GetWorkerCount()) + " worker(s)");
}

bool BatchProcessor::ProcessBatch(const std::vector<std::string>& texts,
                                  double confidence_threshold,
                                  std::vector<std::vector<PIIMatch>>* results,
                                  std::string* error) {
  results->clear();

  if (texts.size() > batch_size_limit_) {
    *error = "Batch size " + std::to_string(texts.size()) + " exceeds limit of " +
             std::to_string(batch_size_limit_);
    LOG_WARN("BatchProcessor", *error);
    return false;
  }

  std::vector<std::future<std::vector<PIIMatch>>> pending;
  pending.reserve(texts.size());
  for (const auto& text : texts) {
    pending.push_back(pool_.Submit([this, &text, confidence_threshold]() {
      auto start = std::chrono::steady_clock::now();
      std::vector<PIIMatch> matches = detector_.Detect(text, confidence_threshold);
      double elapsed_ms = std::chrono::duration<double, std::milli>(
          std::chrono::steady_clock::now() - start).count();
      monitor_.RecordRequest(matches.size(), elapsed_ms);
      return matches;
    }));
  }

  // Every future is waited on before returning, so `texts` outlives the tasks
  std::vector<std::vector<PIIMatch>> collected;
  collected.reserve(texts.size());
  std::string failure;
  for (size_t i = 0; i < pending.size(); ++i) {
    try {
      collected.push_back(pending[i].get());
    } catch (const std::exception& e) {
      if (failure.empty()) {
        failure = "Detection failed for batch item " + std::to_string(i) + ": " + e.what();
      }
      collected.emplace_back();
    }
  }

  if (!failure.empty()) {
    *error = failure;
    LOG_ERROR("BatchProcessor", failure);
    return false;
  }

  *results = std::move(collected);
  LOG_INFO("BatchProcessor", "Processed batch of " + std::to_string(texts.size()) + " text(s)");
  return true;
}

}  // namespace shield
