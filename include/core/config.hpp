#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "model/analysis.hpp"

namespace perf_analyzer::core {

struct ScoreThreshold {
  double good{0.0};
  double acceptable{0.0};
  double poor{0.0};
  bool lower_is_better{false};
};

// cpu_usage, memory_usage and disk_usage default to higher-is-better, matching the
// thresholds the analyzer has always shipped with. Flip lower_is_better to score them as load.
struct ScoreThresholds {
  ScoreThreshold response_time{100.0, 500.0, 2000.0, true};
  ScoreThreshold throughput{1000.0, 500.0, 100.0, false};
  ScoreThreshold cpu_usage{50.0, 70.0, 90.0, false};
  ScoreThreshold memory_usage{60.0, 80.0, 95.0, false};
  ScoreThreshold error_rate{0.1, 1.0, 5.0, true};
  ScoreThreshold disk_usage{60.0, 80.0, 95.0, false};
  ScoreThreshold network_latency{10.0, 50.0, 200.0, true};
};

enum class target_strategy : std::uint8_t {
  REDUCE = 0,
  INCREASE = 1,
  STABILIZE = 2,
};

struct OptimizationTarget {
  std::string id;
  std::string name;
  std::string metric;
  double target_value{0.0};
  model::priority rank{model::priority::MEDIUM};
  target_strategy strategy{target_strategy::REDUCE};
};

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string key_prefix{"perf:analyzer"};
  std::string password{};
  int db{0};
  bool enabled{false};
};

struct AnalyzerConfig {
  std::chrono::milliseconds analysis_interval{60'000};
  std::chrono::milliseconds retention_period{7LL * 24 * 60 * 60 * 1000};
  std::chrono::milliseconds sample_interval{5'000};
  std::chrono::milliseconds analysis_window{60LL * 60 * 1000};
  std::chrono::milliseconds stabilization_delay{30'000};
  ScoreThresholds thresholds{};
  std::vector<OptimizationTarget> optimization_targets{default_optimization_targets()};
  bool reporting_enabled{true};
  bool auto_optimization{false};
  bool benchmark_enabled{true};
  bool debug_logging{false};
  bool stdout_debug{false};
  std::string output_dir{"./logs"};
  RedisConfig redis{};

  static std::vector<OptimizationTarget> default_optimization_targets();
};

const char* to_string(target_strategy strategy) noexcept;

// Lookup by configuration key ("cpu_usage", "response_time", ...); nullptr when unknown.
ScoreThreshold* find_threshold(ScoreThresholds& thresholds, const std::string& name) noexcept;
const ScoreThreshold* find_threshold(const ScoreThresholds& thresholds, const std::string& name) noexcept;

AnalyzerConfig load_analyzer_config(const std::string& path);

}  // namespace perf_analyzer::core
