#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "model/analysis.hpp"

namespace perf_analyzer::model {

struct PlannedOptimization {
  std::string id;
  std::string name;
  std::string category;
  MetricMap expected_impact;
  double estimated_cost{0.0};
  level estimated_effort{level::MEDIUM};
  priority rank{priority::MEDIUM};
  std::vector<std::string> dependencies;
  std::vector<std::string> risks;
};

struct TargetProgress {
  std::string id;
  std::string metric;
  double target_value{0.0};
  double current_value{0.0};
  bool met{false};
};

struct Roi {
  double total_investment{0.0};
  double total_savings{0.0};
  double payback_period{0.0};
  double roi{0.0};
};

struct OptimizationReport {
  std::uint64_t timestamp_ms{0};
  std::optional<Analysis> analysis;
  std::vector<ImplementedOptimization> implemented;
  std::vector<PlannedOptimization> planned;
  std::vector<TargetProgress> targets;
  Roi roi{};
  std::vector<std::string> next_steps;
};

}  // namespace perf_analyzer::model
