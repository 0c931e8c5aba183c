#include "analysis/bottleneck_detector.hpp"

#include <stdexcept>
#include <utility>

namespace perf_analyzer::analysis {

BottleneckDetector::BottleneckDetector(core::ScoreThresholds thresholds)
    : BottleneckDetector(std::move(thresholds), default_rules()) {}

BottleneckDetector::BottleneckDetector(core::ScoreThresholds thresholds, std::vector<BottleneckRule> rules)
    : thresholds_(std::move(thresholds)) {
  rules_.reserve(rules.size());
  for (auto& rule : rules) {
    add_rule(std::move(rule));
  }
}

void BottleneckDetector::add_rule(BottleneckRule rule) {
  if (core::find_threshold(thresholds_, rule.threshold) == nullptr) {
    throw std::invalid_argument("bottleneck rule " + rule.id + " references unknown threshold " + rule.threshold);
  }
  rules_.push_back(std::move(rule));
}

std::vector<model::Bottleneck> BottleneckDetector::detect(const model::MetricSample& latest) const {
  std::vector<model::Bottleneck> bottlenecks;

  for (const auto& rule : rules_) {
    const core::ScoreThreshold* threshold = core::find_threshold(thresholds_, rule.threshold);
    const double value = rule.extract ? rule.extract(latest) : model::metric_value(latest, rule.metric);
    if (value <= threshold->poor) {
      continue;
    }

    model::Bottleneck bottleneck{};
    bottleneck.id = rule.id;
    bottleneck.type = rule.type;
    bottleneck.severity = rule.severity;
    bottleneck.description = rule.description;
    bottleneck.impact = rule.impact;
    bottleneck.location = rule.location;
    bottleneck.detecting_metrics = {rule.metric};
    bottleneck.recommendations = rule.remediation;
    bottleneck.estimated_cost = rule.estimated_cost;
    bottlenecks.push_back(std::move(bottleneck));
  }

  return bottlenecks;
}

std::vector<BottleneckRule> BottleneckDetector::default_rules() {
  return {
      {"cpu-bottleneck", "cpu", "system.cpu", "cpu_usage", model::priority::HIGH, 80.0,
       "CPU usage is consistently high", "system",
       {"Optimize CPU-intensive algorithms", "Implement parallel processing", "Consider horizontal scaling"}, 5000.0},
      {"memory-bottleneck", "memory", "system.memory", "memory_usage", model::priority::HIGH, 75.0,
       "Memory usage is consistently high", "system",
       {"Optimize memory usage patterns", "Implement memory pooling", "Add more RAM"}, 2000.0},
      {"response-time-bottleneck", "application", "application.responseTime", "response_time", model::priority::HIGH,
       85.0, "Response times are consistently slow", "application",
       {"Implement caching strategies", "Optimize database queries", "Add load balancing"}, 3000.0},
  };
}

}  // namespace perf_analyzer::analysis
