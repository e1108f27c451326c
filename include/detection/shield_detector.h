#ifndef SHIELD_DETECTOR_H_
#define SHIELD_DETECTOR_H_

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/shield_types.h"
#include "detection/shield_lexicon.h"
#include "detection/shield_pattern_registry.h"
#include "detection/shield_statistics.h"
#include "masking/shield_masker.h"
#include "util/shield_text_utils.h"

namespace shield {

struct DetectorOptions {
  bool enable_context_validation = true;
  bool enable_strict_validation = true;
  bool collect_statistics = true;
  bool include_context = false;        // fill PIIMatch::context
  size_t context_window_chars = 50;
  bool legacy_name_offsets = false;    // first-occurrence lookup for names
};

// Detect + mask in one call, as returned to API and CLI callers
struct ScanResult {
  std::string original_text;
  std::string masked_text;
  std::vector<PIIMatch> matches;
  bool pii_found = false;
  size_t pii_count = 0;
  double processing_time_ms = 0.0;
  std::string timestamp;               // UTC, ISO 8601

  nlohmann::json ToJson() const;
};

nlohmann::json MatchToJson(const PIIMatch& match);

/**
 * Detector - the detection / validation / masking pipeline
 *
 * Detect() runs, in order: pattern scan (with strict validation), name and
 * address heuristics, confidence scoring, thresholding, overlap resolution
 * and finally masking of the surviving matches with the per-type strategy.
 *
 * The registry and lexicon are borrowed and must outlive the detector.
 * Strategy changes and statistics are synchronised, so a single detector
 * may be used from several threads at once.
 *
 * Usage:
 *   Detector detector;
 *   auto matches = detector.Detect(text);
 *   std::string safe = detector.Mask(text, matches);
 */
class Detector {
 public:
  static constexpr double kDefaultThreshold = 0.7;

  // Fixed scores for the lexical heuristics (context agrees / does not)
  static constexpr double kPrefixedNameConfidence = 0.85;
  static constexpr double kPrefixedNameWeakConfidence = 0.70;
  static constexpr double kFirstNameConfidence = 0.75;
  static constexpr double kFirstNameWeakConfidence = 0.60;
  static constexpr double kAddressConfidence = 0.80;
  static constexpr double kAddressWeakConfidence = 0.65;

  // Longest whitespace or non-whitespace run handed to std::regex whole
  static constexpr size_t kMaxScanRun = 1024;
  static constexpr size_t kRunWindow = 2048;
  static constexpr size_t kRunWindowOverlap = 320;

  explicit Detector(DetectorOptions options = DetectorOptions(),
                    MaskingConfig masking = MaskingConfig(),
                    const PatternRegistry& registry = PatternRegistry::Default(),
                    const Lexicon& lexicon = Lexicon::Default());
  ~Detector();

  Detector(const Detector&) = delete;
  Detector& operator=(const Detector&) = delete;

  /**
   * Find PII in `text`. Matches are non-overlapping, sorted by start, and
   * text.substr(start, end - start) == value for every match.
   * `types` restricts scanning; an empty set scans nothing.
   *
   * The whole text is scanned; bounding input size is up to the caller.
   * Whitespace-free runs longer than kMaxScanRun bytes are scanned in
   * overlapping windows, so a value inside one is only found when it is
   * shorter than kRunWindowOverlap bytes.
   */
  std::vector<PIIMatch> Detect(const std::string& text,
                               double confidence_threshold = kDefaultThreshold,
                               const std::optional<std::set<PIIType>>& types = std::nullopt);

  /**
   * Replace every match with its masked_value. Runs Detect() first when no
   * matches are given. Spans outside the text or overlapping a span already
   * replaced are skipped.
   */
  std::string Mask(const std::string& text,
                   const std::optional<std::vector<PIIMatch>>& matches = std::nullopt,
                   double confidence_threshold = kDefaultThreshold);

  ScanResult Scan(const std::string& text,
                  double confidence_threshold = kDefaultThreshold,
                  const std::optional<std::set<PIIType>>& types = std::nullopt);

  // Strategy changes apply to subsequent calls only
  void SetStrategy(PIIType type, MaskingStrategy strategy);
  void SetAllStrategies(MaskingStrategy strategy);
  MaskingStrategy GetStrategy(PIIType type) const;
  MaskingConfig masking_config() const;

  // nullopt when statistics collection is disabled
  std::optional<DetectionStats> GetStatistics() const;
  void ResetStatistics();

  const DetectorOptions& options() const { return options_; }

 private:
  struct Candidate {
    PIIType type;
    size_t start;
    size_t end;
    double confidence;
  };

  // Byte range handed to std::regex in one call. A match is kept only when
  // it starts in [accept_from, accept_to) and, if `cut_end`, stops short of
  // `end`, so overlapping windows report each value once.
  struct ScanWindow {
    size_t begin;
    size_t end;
    size_t accept_from;
    size_t accept_to;
    bool cut_end;
  };

  // std::regex recurses once per character of a match attempt, so long runs
  // are never passed whole: long whitespace runs split the text, long
  // whitespace-free runs are cut into overlapping windows
  static std::vector<ScanWindow> PlanScanWindows(const std::string& text);
  static void ForEachMatch(const std::string& text, const std::vector<ScanWindow>& windows,
                           const std::regex& re,
                           const std::function<void(size_t, size_t)>& on_match);

  void DetectPatterns(const std::string& text, const std::vector<ScanWindow>& windows,
                      const std::optional<std::set<PIIType>>& types,
                      std::vector<Candidate>* out) const;
  void DetectNames(const std::string& text, std::vector<Candidate>* out) const;
  void DetectAddresses(const std::string& text, const std::vector<ScanWindow>& windows,
                       std::vector<Candidate>* out) const;

  // Byte span for the name made of tokens [first, last]; false if not found
  bool LocateName(const std::string& text, const std::vector<text::Token>& tokens,
                  size_t first, size_t last, size_t* start, size_t* end) const;
  void AddName(const std::string& text, const std::vector<text::Token>& tokens,
               size_t first, size_t last, double strong, double weak,
               std::vector<Candidate>* out) const;

  static std::unique_ptr<std::regex> BuildAddressRegex(const Lexicon& lexicon);

  const DetectorOptions options_;
  const PatternRegistry& registry_;
  const Lexicon& lexicon_;
  const std::unique_ptr<std::regex> address_regex_;

  mutable std::mutex config_mutex_;
  MaskingConfig masking_config_;

  Masker masker_;
  const std::unique_ptr<StatisticsCollector> statistics_;
};

}  // namespace shield

#endif  // SHIELD_DETECTOR_H_
