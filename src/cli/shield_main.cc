#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config/shield_config.h"
#include "core/shield_types.h"
#include "detection/shield_batch_processor.h"
#include "detection/shield_detector.h"
#include "detection/shield_statistics.h"
#include "util/logger.h"
#include "util/shield_text_utils.h"

namespace {

// Exit codes
const int kExitOk = 0;
const int kExitFailure = 2;
const int kExitUsage = 3;

// Input may hold invalid UTF-8; it is written out as U+FFFD instead of failing
std::string Dump(const nlohmann::json& j) {
  return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

struct CliOptions {
  std::string command;
  std::optional<std::string> text;
  std::optional<std::string> file;
  std::optional<double> threshold;
  std::optional<std::set<shield::PIIType>> types;
  std::optional<shield::MaskingStrategy> strategy;
  std::string config_path;
  bool json = false;
  bool verbose = false;
};

void PrintUsage(const char* program) {
  std::cout << "Usage: " << program << " <command> [options]\n\n"
            << "Commands:\n"
            << "  detect   Report PII found in the input\n"
            << "  mask     Print the input with PII masked\n"
            << "  types    List supported PII types\n"
            << "  stats    Detect each input line in a batch and print statistics\n\n"
            << "Options:\n"
            << "  --text <text>         Input text (default: read stdin)\n"
            << "  --file <path>         Read input from a file\n"
            << "  --threshold <0..1>    Minimum confidence (default: 0.7)\n"
            << "  --types <A,B,...>     Only scan these types, e.g. EMAIL,SSN\n"
            << "  --strategy <name>     FULL, PARTIAL, REDACT, HASH or TOKENIZE for all types\n"
            << "  --config <path>       JSON config file\n"
            << "  --json                JSON output\n"
            << "  --verbose, -v         Debug logging (debug builds only)\n"
            << "  --help, -h            Show this help\n\n"
            << "Environment variables PII_SHIELD_* override the config file;\n"
            << "command-line options override both.\n";
}

bool ParseThreshold(const char* raw, double* out) {
  char* end = nullptr;
  double value = std::strtod(raw, &end);
  if (end == raw || *end != '\0' || std::isnan(value) || value < 0.0 || value > 1.0) {
    return false;
  }
  *out = value;
  return true;
}

bool ParseTypeList(const std::string& raw, std::set<shield::PIIType>* out, std::string* error) {
  std::stringstream ss(raw);
  std::string item;
  while (std::getline(ss, item, ',')) {
    item = shield::text::Strip(item, " \t");
    if (item.empty()) continue;
    auto type = shield::ParseType(item);
    if (!type) {
      *error = "Invalid PII type: " + item;
      return false;
    }
    out->insert(*type);
  }
  if (out->empty()) {
    *error = "--types needs at least one type";
    return false;
  }
  return true;
}

// Returns kExitOk, or an exit code after printing the problem
int ParseArgs(int argc, char* argv[], CliOptions* options) {
  if (argc < 2) {
    PrintUsage(argv[0]);
    return kExitUsage;
  }

  for (int i = 1; i < argc; i++) {
    if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      PrintUsage(argv[0]);
      options->command = "help";
      return kExitOk;
    } else if (strcmp(argv[i], "--text") == 0 && i + 1 < argc) {
      options->text = argv[++i];
    } else if (strcmp(argv[i], "--file") == 0 && i + 1 < argc) {
      options->file = argv[++i];
    } else if (strcmp(argv[i], "--threshold") == 0 && i + 1 < argc) {
      double value = 0.0;
      if (!ParseThreshold(argv[++i], &value)) {
        std::cerr << "Invalid threshold: " << argv[i] << " (expected 0.0-1.0)" << std::endl;
        return kExitUsage;
      }
      options->threshold = value;
    } else if (strcmp(argv[i], "--types") == 0 && i + 1 < argc) {
      std::set<shield::PIIType> types;
      std::string error;
      if (!ParseTypeList(argv[++i], &types, &error)) {
        std::cerr << error << std::endl;
        return kExitUsage;
      }
      options->types = types;
    } else if (strcmp(argv[i], "--strategy") == 0 && i + 1 < argc) {
      auto strategy = shield::ParseStrategy(argv[++i]);
      if (!strategy) {
        std::cerr << "Invalid masking strategy: " << argv[i] << std::endl;
        return kExitUsage;
      }
      options->strategy = *strategy;
    } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
      options->config_path = argv[++i];
    } else if (strcmp(argv[i], "--json") == 0) {
      options->json = true;
    } else if (strcmp(argv[i], "--verbose") == 0 || strcmp(argv[i], "-v") == 0) {
      options->verbose = true;
    } else if (argv[i][0] != '-' && options->command.empty()) {
      options->command = argv[i];
    } else {
      std::cerr << "Unknown option: " << argv[i] << std::endl;
      PrintUsage(argv[0]);
      return kExitUsage;
    }
  }

  if (options->command != "detect" && options->command != "mask" &&
      options->command != "types" && options->command != "stats") {
    std::cerr << "Unknown command: " << options->command << std::endl;
    PrintUsage(argv[0]);
    return kExitUsage;
  }
  if (options->text && options->file) {
    std::cerr << "--text and --file are mutually exclusive" << std::endl;
    return kExitUsage;
  }
  return kExitOk;
}

bool ReadInput(const CliOptions& options, std::string* out, std::string* error) {
  if (options.text) {
    *out = *options.text;
    return true;
  }
  if (options.file) {
    std::ifstream in(*options.file, std::ios::binary);
    if (!in) {
      *error = "Cannot open input file: " + *options.file;
      return false;
    }
    out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return true;
  }
  out->assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  return true;
}

bool LoadConfig(const CliOptions& options, shield::ShieldConfig* config, std::string* error) {
  if (!options.config_path.empty() && !config->LoadFile(options.config_path, error)) {
    return false;
  }
  if (!config->ApplyEnvironment(error)) {
    return false;
  }
  if (options.threshold) {
    config->detection.default_confidence_threshold = *options.threshold;
  }
  if (options.strategy) {
    config->masking.default_strategy = *options.strategy;
    config->masking.overrides.clear();
  }
  if (options.verbose) {
    config->logging.log_level = "DEBUG";
  }
  return config->Validate(error);
}

int RunTypes(const CliOptions& options) {
  if (options.json) {
    nlohmann::json list = nlohmann::json::array();
    for (shield::PIIType type : shield::AllTypes()) {
      list.push_back({{"type", shield::TypeName(type)},
                      {"description", shield::TypeDescription(type)}});
    }
    std::cout << Dump({{"supported_types", list}, {"count", list.size()}})
              << std::endl;
    return kExitOk;
  }

  for (shield::PIIType type : shield::AllTypes()) {
    std::cout << shield::TypeName(type) << "\t" << shield::TypeDescription(type) << "\n";
  }
  return kExitOk;
}

int RunDetect(const CliOptions& options, const shield::ShieldConfig& config,
              shield::Detector& detector, const std::string& input) {
  shield::ScanResult result =
      detector.Scan(input, config.detection.default_confidence_threshold, options.types);

  if (options.json) {
    std::cout << Dump(result.ToJson()) << std::endl;
    return kExitOk;
  }

  for (const auto& match : result.matches) {
    std::cout << "[" << match.start << "-" << match.end << "] "
              << shield::text::FormatMatchForDisplay(match) << "\n";
    if (match.context) {
      std::cout << "    " << *match.context << "\n";
    }
  }
  std::cout << result.pii_count << " PII instance(s) found" << std::endl;
  return kExitOk;
}

int RunMask(const CliOptions& options, const shield::ShieldConfig& config,
            shield::Detector& detector, const std::string& input) {
  shield::ScanResult result =
      detector.Scan(input, config.detection.default_confidence_threshold, options.types);

  if (options.json) {
    nlohmann::json out = {
      {"masked_text", result.masked_text},
      {"pii_count", result.pii_count},
      {"processing_time_ms", result.processing_time_ms}
    };
    std::cout << Dump(out) << std::endl;
    return kExitOk;
  }

  std::cout << result.masked_text;
  if (result.masked_text.empty() || result.masked_text.back() != '\n') {
    std::cout << "\n";
  }
  return kExitOk;
}

int RunStats(const CliOptions& options, const shield::ShieldConfig& config,
             shield::Detector& detector, const std::string& input) {
  std::vector<std::string> lines;
  std::stringstream ss(input);
  std::string line;
  while (std::getline(ss, line)) {
    if (shield::text::NormalizeWhitespace(line).empty()) {
      continue;
    }
    std::string error;
    if (!config.CheckTextLength(line, &error)) {
      std::cerr << "[ERROR] Line " << (lines.size() + 1) << ": " << error << std::endl;
      return kExitFailure;
    }
    lines.push_back(line);
  }

  shield::BatchProcessor batch(detector, config.detection.batch_size_limit,
                               config.detection.batch_workers);

  // Feed the lines through in chunks no larger than the batch limit
  for (size_t offset = 0; offset < lines.size(); offset += batch.batch_size_limit()) {
    size_t count = std::min(batch.batch_size_limit(), lines.size() - offset);
    std::vector<std::string> chunk(lines.begin() + offset, lines.begin() + offset + count);
    std::vector<std::vector<shield::PIIMatch>> results;
    std::string error;
    if (!batch.ProcessBatch(chunk, config.detection.default_confidence_threshold,
                            &results, &error)) {
      std::cerr << "[ERROR] " << error << std::endl;
      return kExitFailure;
    }
  }

  std::optional<shield::DetectionStats> stats = detector.GetStatistics();
  shield::PerformanceSummary perf = batch.GetPerformance();

  if (options.json) {
    nlohmann::json out = {
      {"texts", lines.size()},
      {"performance", perf.ToJson()}
    };
    out["statistics"] = stats ? stats->ToJson() : nlohmann::json(nullptr);
    std::cout << Dump(out) << std::endl;
    return kExitOk;
  }

  std::cout << "Texts: " << lines.size() << "\n";
  if (stats) {
    std::cout << stats->ToString();
  } else {
    std::cout << "Statistics collection is disabled\n";
  }
  std::cout << "Requests:   " << perf.total_requests << "\n"
            << "Matches:    " << perf.total_matches << "\n"
            << "Avg / min / max (ms): " << perf.avg_time_ms << " / " << perf.min_time_ms
            << " / " << perf.max_time_ms << "\n"
            << "Throughput: " << perf.throughput_per_sec << " texts/sec" << std::endl;
  return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliOptions options;
  int rc = ParseArgs(argc, argv, &options);
  if (rc != kExitOk || options.command == "help") {
    return rc;
  }

  if (options.command == "types") {
    return RunTypes(options);
  }

  shield::ShieldConfig config;
  std::string error;
  if (!LoadConfig(options, &config, &error)) {
    std::cerr << "[FATAL] " << error << std::endl;
    return kExitFailure;
  }
  if (!config.ApplyLogging()) {
    std::cerr << "[FATAL] Unknown log level: " << config.logging.log_level << std::endl;
    return kExitFailure;
  }
  if (options.verbose && !shield::log::Logger::DebugCompiledIn()) {
    LOG_WARN("CLI", "--verbose has no effect: debug logging is not compiled into this build");
  }

  std::string input;
  if (!ReadInput(options, &input, &error)) {
    LOG_ERROR("CLI", error);
    return kExitFailure;
  }
  if (shield::text::NormalizeWhitespace(input).empty()) {
    LOG_ERROR("CLI", "Input text is empty");
    return kExitFailure;
  }
  if (options.command != "stats" && !config.CheckTextLength(input, &error)) {
    LOG_ERROR("CLI", error);
    return kExitFailure;
  }

  shield::Detector detector(config.ToDetectorOptions(), config.BuildMaskingConfig());
  LOG_DEBUG("CLI", "Effective config: " +
                   config.ToJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

  if (options.command == "detect") {
    return RunDetect(options, config, detector, input);
  }
  if (options.command == "mask") {
    return RunMask(options, config, detector, input);
  }
  return RunStats(options, config, detector, input);
}
