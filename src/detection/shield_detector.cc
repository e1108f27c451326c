#include "detection/shield_detector.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <iterator>
#include <utility>

#include "detection/shield_confidence.h"
#include "detection/shield_context_validator.h"
#include "detection/shield_overlap_resolver.h"
#include "detection/shield_validator.h"
#include "util/logger.h"

namespace shield {

namespace {

// Punctuation ignored when matching a token against the word lists
const char kWordPunctuation[] = ".,!?;:()[]{}";

// Trimmed from the outer edges of a name span
const char kLeadingTrim[] = "([{\"'";
const char kTrailingTrim[] = ".,!?;:()[]{}\"'";

bool IsSpace(char c) {
  return std::isspace(static_cast<unsigned char>(c)) != 0;
}

bool TypeRequested(const std::optional<std::set<PIIType>>& types, PIIType type) {
  return !types || types->count(type) > 0;
}

double ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration<double, std::milli>(
      std::chrono::steady_clock::now() - since).count();
}

std::string UtcTimestamp() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
      now.time_since_epoch()) % 1000;
  std::time_t time = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf;
  gmtime_r(&time, &tm_buf);

  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
  char out[40];
  std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms.count()));
  return out;
}

}  // namespace

// ============================================================
// JSON
// ============================================================

nlohmann::json MatchToJson(const PIIMatch& match) {
  nlohmann::json j = {
    {"pii_type", TypeName(match.type)},
    {"value", match.value},
    {"start", match.start},
    {"end", match.end},
    {"confidence", match.confidence},
    {"masked_value", match.masked_value}
  };
  if (match.context) {
    j["context"] = *match.context;
  }
  return j;
}

nlohmann::json ScanResult::ToJson() const {
  nlohmann::json match_list = nlohmann::json::array();
  for (const auto& match : matches) {
    match_list.push_back(MatchToJson(match));
  }
  return {
    {"original_text", original_text},
    {"masked_text", masked_text},
    {"pii_found", pii_found},
    {"pii_count", pii_count},
    {"matches", match_list},
    {"processing_time_ms", processing_time_ms},
    {"timestamp", timestamp}
  };
}

// ============================================================
// Detector
// ============================================================

Detector::Detector(DetectorOptions options,
                   MaskingConfig masking,
                   const PatternRegistry& registry,
                   const Lexicon& lexicon)
    : options_(options),
      registry_(registry),
      lexicon_(lexicon),
      address_regex_(BuildAddressRegex(lexicon)),
      masking_config_(masking),
      masker_(MaskingStrategy::PARTIAL),
      statistics_(options.collect_statistics ? std::make_unique<StatisticsCollector>()
                                             : nullptr) {
  LOG_DEBUG("Detector", "Initialized with " + std::to_string(registry_.size()) + " pattern(s)");
}

Detector::~Detector() = default;

std::unique_ptr<std::regex> Detector::BuildAddressRegex(const Lexicon& lexicon) {
  // <number> <1-3 capitalized words> <street type>
  const std::string pattern =
      R"(\b\d+\s+[A-Z][a-z]+(?:\s+[A-Z][a-z]+){0,2}\s+)" +
      lexicon.StreetTypeAlternation() + R"(\b)";
  try {
    return std::make_unique<std::regex>(
        pattern, std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
  } catch (const std::regex_error& e) {
    LOG_ERROR("Detector", std::string("Address pattern rejected, address detection disabled: ") +
                          e.what());
    return nullptr;
  }
}

std::vector<PIIMatch> Detector::Detect(const std::string& text,
                                       double confidence_threshold,
                                       const std::optional<std::set<PIIType>>& types) {
  auto start_time = std::chrono::steady_clock::now();
  LOG_DEBUG("Detector", "Scanning " + std::to_string(text.size()) + " byte(s): " +
                        text::SanitizeForLogging(text));

  const std::vector<ScanWindow> windows = PlanScanWindows(text);

  std::vector<Candidate> candidates;
  DetectPatterns(text, windows, types, &candidates);
  if (TypeRequested(types, PIIType::PERSON_NAME)) {
    DetectNames(text, &candidates);
  }
  if (TypeRequested(types, PIIType::ADDRESS)) {
    DetectAddresses(text, windows, &candidates);
  }

  std::vector<PIIMatch> filtered;
  filtered.reserve(candidates.size());
  for (const auto& c : candidates) {
    if (c.confidence < confidence_threshold) {
      continue;
    }
    PIIMatch match;
    match.type = c.type;
    match.value = text.substr(c.start, c.end - c.start);
    match.start = c.start;
    match.end = c.end;
    match.confidence = c.confidence;
    filtered.push_back(std::move(match));
  }

  std::vector<PIIMatch> matches = OverlapResolver::Resolve(std::move(filtered));

  const MaskingConfig strategies = masking_config();
  for (auto& match : matches) {
    match.masked_value = masker_.Mask(match.value, match.type,
                                      strategies.GetStrategy(match.type));
    if (options_.include_context) {
      match.context = text::GetContext(text, match.start, match.end,
                                       options_.context_window_chars);
    }
  }

  double elapsed_ms = ElapsedMs(start_time);
  if (statistics_) {
    statistics_->RecordProcessing(elapsed_ms);
    for (const auto& match : matches) {
      statistics_->RecordDetection(match.type);
    }
  }

  LOG_DEBUG("Detector", "Detected " + std::to_string(matches.size()) + " match(es) from " +
                        std::to_string(candidates.size()) + " candidate(s)");
  return matches;
}

std::vector<Detector::ScanWindow> Detector::PlanScanWindows(const std::string& text) {
  std::vector<ScanWindow> windows;
  const size_t n = text.size();
  size_t segment_begin = 0;
  size_t i = 0;
  while (i < n) {
    const bool space = IsSpace(text[i]);
    size_t run_end = i + 1;
    while (run_end < n && IsSpace(text[run_end]) == space) {
      ++run_end;
    }

    if (run_end - i > kMaxScanRun) {
      if (i > segment_begin) {
        windows.push_back({segment_begin, i, segment_begin, i, false});
      }
      if (!space) {
        LOG_WARN("Detector", "Scanning " + std::to_string(run_end - i) +
                             "-byte run without whitespace in windows");
        const size_t step = kRunWindow - kRunWindowOverlap;
        for (size_t w = i;; w += step) {
          const size_t w_end = std::min(run_end, w + kRunWindow);
          const bool cut_end = w_end < run_end;
          // Owns match starts in (w, w + step]; the first window also owns w
          windows.push_back({w, w_end, w == i ? w : w + 1, cut_end ? w + step + 1 : w_end,
                             cut_end});
          if (!cut_end) {
            break;
          }
        }
      }
      segment_begin = run_end;
    }
    i = run_end;
  }
  if (n > segment_begin) {
    windows.push_back({segment_begin, n, segment_begin, n, false});
  }
  return windows;
}

void Detector::ForEachMatch(const std::string& text, const std::vector<ScanWindow>& windows,
                            const std::regex& re,
                            const std::function<void(size_t, size_t)>& on_match) {
  for (const auto& w : windows) {
    // Let \b see the byte before the window
    const auto flags = w.begin > 0 ? std::regex_constants::match_prev_avail
                                   : std::regex_constants::match_default;
    std::sregex_iterator it(text.begin() + w.begin, text.begin() + w.end, re, flags);
    for (; it != std::sregex_iterator(); ++it) {
      const size_t start = static_cast<size_t>((*it)[0].first - text.begin());
      const size_t end = start + static_cast<size_t>(it->length(0));
      if (start < w.accept_from || start >= w.accept_to || (w.cut_end && end == w.end)) {
        continue;
      }
      on_match(start, end);
    }
  }
}

void Detector::DetectPatterns(const std::string& text, const std::vector<ScanWindow>& windows,
                              const std::optional<std::set<PIIType>>& types,
                              std::vector<Candidate>* out) const {
  for (const auto& compiled : registry_.Compiled()) {
    const PIIPattern& pattern = *compiled.pattern;
    if (!TypeRequested(types, pattern.type)) {
      continue;
    }

    try {
      ForEachMatch(text, windows, *compiled.regex, [&](size_t start, size_t end) {
        if (end == start) {
          return;
        }
        const std::string value = text.substr(start, end - start);

        if (pattern.requires_validation && options_.enable_strict_validation &&
            !Validator::Validate(value, pattern.type)) {
          return;
        }

        // Only names and addresses carry a context signal
        double confidence = ConfidenceCalculator::Adjust(
            pattern.confidence, false, true,
            ConfidenceCalculator::IsLengthAppropriate(value, pattern.type));
        out->push_back({pattern.type, start, end, confidence});
      });
    } catch (const std::regex_error& e) {
      LOG_WARN("Detector", "Pattern '" + pattern.description + "' aborted: " + e.what());
    }
  }
}

bool Detector::LocateName(const std::string& text, const std::vector<text::Token>& tokens,
                          size_t first, size_t last, size_t* start, size_t* end) const {
  if (options_.legacy_name_offsets) {
    std::string joined = tokens[first].word;
    for (size_t i = first + 1; i <= last; ++i) {
      joined += " " + tokens[i].word;
    }
    size_t pos = text.find(joined);
    if (pos == std::string::npos) {
      return false;
    }
    *start = pos;
    *end = pos + joined.size();
    return true;
  }

  size_t s = tokens[first].start;
  size_t e = tokens[last].end;
  while (s < e && std::strchr(kLeadingTrim, text[s]) != nullptr) {
    ++s;
  }
  const size_t untrimmed_end = e;
  while (e > s && std::strchr(kTrailingTrim, text[e - 1]) != nullptr) {
    --e;
  }
  // Keep the period of an abbreviated suffix ("Jr.")
  if (e < untrimmed_end && text[e] == '.') {
    size_t word_start = std::max(s, tokens[last].start);
    if (lexicon_.IsNameSuffix(text::ToLower(text.substr(word_start, e - word_start)))) {
      ++e;
    }
  }
  if (e <= s) {
    return false;
  }
  *start = s;
  *end = e;
  return true;
}

void Detector::AddName(const std::string& text, const std::vector<text::Token>& tokens,
                       size_t first, size_t last, double strong, double weak,
                       std::vector<Candidate>* out) const {
  size_t start = 0;
  size_t end = 0;
  if (!LocateName(text, tokens, first, last, &start, &end)) {
    return;
  }
  bool context_ok = !options_.enable_context_validation ||
                    ContextValidator::IsLikelyNameContext(text, start, end);
  out->push_back({PIIType::PERSON_NAME, start, end, context_ok ? strong : weak});
}

void Detector::DetectNames(const std::string& text, std::vector<Candidate>* out) const {
  const std::vector<text::Token> tokens = text::Tokenize(text);
  const size_t n = tokens.size();

  size_t i = 0;
  while (i < n) {
    const std::string word = text::ToLower(text::Strip(tokens[i].word, kWordPunctuation));

    // Honorific followed by up to three capitalized words or suffixes
    if (lexicon_.IsNamePrefix(word) && i + 1 < n) {
      size_t j = i + 1;
      while (j < n && j < i + 4) {
        const std::string part = text::Strip(tokens[j].word, kWordPunctuation);
        if (text::IsCapitalizedWord(part) || lexicon_.IsNameSuffix(text::ToLower(part))) {
          ++j;
        } else {
          break;
        }
      }
      if (j - i >= 2) {
        AddName(text, tokens, i, j - 1, kPrefixedNameConfidence, kPrefixedNameWeakConfidence,
                out);
      }
      i = j;
      continue;
    }

    // Common first name followed by a capitalized surname
    if (lexicon_.IsCommonFirstName(word) && i + 1 < n) {
      const std::string next = text::Strip(tokens[i + 1].word, kWordPunctuation);
      if (text::IsCapitalizedWord(next) && next.size() > 2) {
        AddName(text, tokens, i, i + 1, kFirstNameConfidence, kFirstNameWeakConfidence, out);
      }
      i += 2;
      continue;
    }

    ++i;
  }
}

void Detector::DetectAddresses(const std::string& text, const std::vector<ScanWindow>& windows,
                               std::vector<Candidate>* out) const {
  if (!address_regex_) {
    return;
  }

  try {
    ForEachMatch(text, windows, *address_regex_, [&](size_t start, size_t end) {
      bool context_ok = !options_.enable_context_validation ||
                        ContextValidator::IsLikelyAddressContext(text, start, end);
      out->push_back({PIIType::ADDRESS, start, end,
                      context_ok ? kAddressConfidence : kAddressWeakConfidence});
    });
  } catch (const std::regex_error& e) {
    LOG_WARN("Detector", std::string("Address scan aborted: ") + e.what());
  }
}

std::string Detector::Mask(const std::string& text,
                           const std::optional<std::vector<PIIMatch>>& matches,
                           double confidence_threshold) {
  std::vector<PIIMatch> to_apply = matches ? *matches : Detect(text, confidence_threshold);
  if (to_apply.empty()) {
    return text;
  }

  std::stable_sort(to_apply.begin(), to_apply.end(),
                   [](const PIIMatch& a, const PIIMatch& b) { return a.start > b.start; });

  std::string result = text;
  size_t limit = text.size();  // start of the last span replaced
  for (const auto& match : to_apply) {
    if (match.start > match.end || match.end > limit) {
      LOG_WARN("Detector", "Skipping " + TypeName(match.type) + " span [" +
                           std::to_string(match.start) + ", " + std::to_string(match.end) +
                           ") outside text or overlapping another");
      continue;
    }
    result.replace(match.start, match.end - match.start, match.masked_value);
    limit = match.start;
  }
  return result;
}

ScanResult Detector::Scan(const std::string& text,
                          double confidence_threshold,
                          const std::optional<std::set<PIIType>>& types) {
  auto start_time = std::chrono::steady_clock::now();

  ScanResult result;
  result.original_text = text;
  result.matches = Detect(text, confidence_threshold, types);
  result.masked_text = Mask(text, result.matches);
  result.pii_found = !result.matches.empty();
  result.pii_count = result.matches.size();
  result.processing_time_ms = ElapsedMs(start_time);
  result.timestamp = UtcTimestamp();
  return result;
}

void Detector::SetStrategy(PIIType type, MaskingStrategy strategy) {
  std::lock_guard<std::mutex> lock(config_mutex_);
  masking_config_.SetStrategy(type, strategy);
}

void Detector::SetAllStrategies(MaskingStrategy strategy) {
  std::lock_guard<std::mutex> lock(config_mutex_);
  masking_config_.SetAllStrategies(strategy);
}

MaskingStrategy Detector::GetStrategy(PIIType type) const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return masking_config_.GetStrategy(type);
}

MaskingConfig Detector::masking_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return masking_config_;
}

std::optional<DetectionStats> Detector::GetStatistics() const {
  if (!statistics_) {
    return std::nullopt;
  }
  return statistics_->GetStats();
}

void Detector::ResetStatistics() {
  if (statistics_) {
    statistics_->Reset();
  }
}

}  // namespace shield
