#pragma once

#include <functional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "model/analysis.hpp"
#include "model/metric_sample.hpp"

namespace perf_analyzer::analysis {

// One row of the detection table: a metric breaching the poor breakpoint of a threshold.
struct BottleneckRule {
  std::string id;
  std::string type;
  std::string metric;
  std::string threshold;
  model::priority severity;
  double impact;
  std::string description;
  std::string location;
  std::vector<std::string> remediation;
  double estimated_cost;
  // Derives the compared value; the metric path is read directly when unset.
  std::function<double(const model::MetricSample&)> extract{};
};

class BottleneckDetector {
 public:
  explicit BottleneckDetector(core::ScoreThresholds thresholds);
  BottleneckDetector(core::ScoreThresholds thresholds, std::vector<BottleneckRule> rules);

  // Appends to the table. Throws std::invalid_argument when the rule names an unknown threshold.
  void add_rule(BottleneckRule rule);

  // Evaluates only the latest sample; a breach is strictly greater than the poor breakpoint.
  // An exception from a rule's extract propagates.
  [[nodiscard]] std::vector<model::Bottleneck> detect(const model::MetricSample& latest) const;

  [[nodiscard]] const std::vector<BottleneckRule>& rules() const noexcept { return rules_; }

  static std::vector<BottleneckRule> default_rules();

 private:
  core::ScoreThresholds thresholds_;
  std::vector<BottleneckRule> rules_;
};

}  // namespace perf_analyzer::analysis
