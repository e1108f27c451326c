#ifndef SHIELD_BATCH_PROCESSOR_H_
#define SHIELD_BATCH_PROCESSOR_H_

#include <string>
#include <vector>

#include "core/shield_types.h"
#include "detection/shield_detector.h"
#include "detection/shield_statistics.h"
#include "util/shield_thread_pool.h"

namespace shield {

/**
 * BatchProcessor - runs Detect() over many texts on a worker pool
 *
 * Each text is still detected sequentially; parallelism is across texts
 * only. Results come back in input order.
 */
class BatchProcessor {
 public:
  static constexpr size_t kDefaultBatchSizeLimit = 100;

  // `num_workers` = 0 sizes the pool to the hardware
  explicit BatchProcessor(Detector& detector,
                          size_t batch_size_limit = kDefaultBatchSizeLimit,
                          size_t num_workers = 0);

  BatchProcessor(const BatchProcessor&) = delete;
  BatchProcessor& operator=(const BatchProcessor&) = delete;

  /**
   * One match list per input text. Returns false and sets `error` when the
   * batch is larger than the limit or a detection task failed; `results`
   * is left empty in that case.
   */
  bool ProcessBatch(const std::vector<std::string>& texts,
                    double confidence_threshold,
                    std::vector<std::vector<PIIMatch>>* results,
                    std::string* error);

  size_t batch_size_limit() const { return batch_size_limit_; }
  size_t worker_count() const { return pool_.GetWorkerCount(); }

  PerformanceSummary GetPerformance() const { return monitor_.GetSummary(); }

 private:
  Detector& detector_;
  const size_t batch_size_limit_;
  PerformanceMonitor monitor_;
  ThreadPool pool_;
};

}  // namespace shield

#endif  // SHIELD_BATCH_PROCESSOR_H_
