#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace perf_analyzer::model {

enum class health_status : std::uint8_t {
  EXCELLENT = 0,
  GOOD = 1,
  ACCEPTABLE = 2,
  POOR = 3,
  CRITICAL = 4,
};

enum class trend : std::uint8_t {
  IMPROVING = 0,
  STABLE = 1,
  DEGRADING = 2,
};

// Shared by issue severity, bottleneck severity and recommendation priority.
enum class priority : std::uint8_t {
  LOW = 0,
  MEDIUM = 1,
  HIGH = 2,
  CRITICAL = 3,
};

enum class level : std::uint8_t {
  LOW = 0,
  MEDIUM = 1,
  HIGH = 2,
};

enum class comparison : std::uint8_t {
  BETTER = 0,
  SAME = 1,
  WORSE = 2,
};

enum class optimization_status : std::uint8_t {
  SUCCESS = 0,
  PARTIAL = 1,
  FAILED = 2,
};

using MetricMap = std::map<std::string, double>;

struct PerformanceIssue {
  std::string id;
  std::string category;
  priority severity{priority::HIGH};
  std::string title;
  std::string description;
  std::string impact;
  std::uint64_t detected_at_ms{0};
  std::uint32_t frequency{1};
  std::vector<std::string> affected_metrics;
  std::vector<std::string> correlations;
};

struct MetricScore {
  std::string name;
  std::string path;
  double value{0.0};
  double score{0.0};
};

struct CategoryScore {
  double score{0.0};
  health_status status{health_status::CRITICAL};
  std::vector<MetricScore> metrics;
  trend direction{trend::STABLE};
  std::map<std::string, trend> metric_trends;
  std::vector<PerformanceIssue> issues;
};

struct Bottleneck {
  std::string id;
  std::string type;
  priority severity{priority::HIGH};
  std::string description;
  double impact{0.0};
  std::string location;
  std::vector<std::string> detecting_metrics;
  std::vector<std::string> recommendations;
  double estimated_cost{0.0};
};

struct OptimizationRecommendation {
  struct Impact {
    double performance{0.0};
    double cost{0.0};
    double reliability{0.0};
    double maintainability{0.0};
  };

  struct Effort {
    level implementation{level::MEDIUM};
    level testing{level::MEDIUM};
    level maintenance{level::LOW};
  };

  struct Risk {
    level risk_level{level::LOW};
    std::vector<std::string> factors;
    std::vector<std::string> mitigation;
  };

  struct Implementation {
    std::vector<std::string> steps;
    std::string timeline;
    std::vector<std::string> resources;
    std::vector<std::string> dependencies;
  };

  struct Validation {
    std::vector<std::string> metrics;
    std::vector<std::string> tests;
    std::vector<std::string> criteria;
  };

  std::string id;
  std::string title;
  std::string description;
  std::string category;
  priority rank{priority::MEDIUM};
  Impact impact{};
  Effort effort{};
  Risk risk{};
  Implementation implementation{};
  Validation validation{};
  std::vector<std::string> alternatives;
  std::vector<std::string> references;
};

struct BenchmarkResult {
  std::string id;
  std::string name;
  std::string title;
  std::uint64_t timestamp_ms{0};
  std::string category;
  MetricMap metrics;
  MetricMap baseline;
  std::map<std::string, comparison> comparisons;
  double score{0.0};
  std::optional<double> baseline_score;
};

struct ImplementedOptimization {
  std::string id;
  std::string name;
  std::uint64_t implemented_at_ms{0};
  std::string category;
  MetricMap before;
  MetricMap after;
  MetricMap improvement;
  double cost{0.0};
  level effort{level::MEDIUM};
  optimization_status status{optimization_status::SUCCESS};
  std::string notes;
};

struct TrendSummary {
  trend overall{trend::STABLE};
  std::map<std::string, trend> categories;
};

struct Analysis {
  std::uint64_t timestamp_ms{0};
  std::string period{"1h"};
  double overall_score{0.0};
  std::map<std::string, CategoryScore> categories;
  std::vector<Bottleneck> bottlenecks;
  std::vector<OptimizationRecommendation> recommendations;
  TrendSummary trends{};
  std::vector<BenchmarkResult> benchmarks;
  bool final_report{false};
};

const char* to_string(health_status value) noexcept;
const char* to_string(trend value) noexcept;
const char* to_string(priority value) noexcept;
const char* to_string(level value) noexcept;
const char* to_string(comparison value) noexcept;
const char* to_string(optimization_status value) noexcept;

// Inverse lookups used by configuration and JSON loading.
std::optional<priority> parse_priority(std::string_view text) noexcept;
std::optional<level> parse_level(std::string_view text) noexcept;

}  // namespace perf_analyzer::model
