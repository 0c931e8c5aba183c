#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "model/analysis.hpp"
#include "model/metric_sample.hpp"

namespace perf_analyzer::analysis {

// Piecewise 0..100 score of value against the threshold's breakpoints and direction.
double score(double value, const core::ScoreThreshold& threshold) noexcept;

model::health_status status_from_score(double score) noexcept;

class Scorer {
 public:
  static constexpr double kIssueScore = 60.0;
  static constexpr double kCriticalIssueScore = 30.0;

  explicit Scorer(core::ScoreThresholds thresholds);

  // Scores the latest sample of the window; trends are filled in by TrendAnalyzer.
  [[nodiscard]] model::CategoryScore score_system(const model::MetricSample& latest, std::uint64_t now_ms) const;
  [[nodiscard]] model::CategoryScore score_application(const model::MetricSample& latest, std::uint64_t now_ms) const;
  [[nodiscard]] model::CategoryScore score_resources(const model::MetricSample& latest, std::uint64_t now_ms) const;
  [[nodiscard]] model::CategoryScore score_network(const model::MetricSample& latest, std::uint64_t now_ms) const;
  [[nodiscard]] model::CategoryScore score_agents(const model::MetricSample& latest, std::uint64_t now_ms) const;

  // All five categories keyed by name. Throws std::invalid_argument on an empty window.
  [[nodiscard]] std::map<std::string, model::CategoryScore> score_categories(
      const std::vector<model::MetricSample>& window, std::uint64_t now_ms) const;

  [[nodiscard]] const core::ScoreThresholds& thresholds() const noexcept { return thresholds_; }

 private:
  core::ScoreThresholds thresholds_;
};

double overall_score(const std::map<std::string, model::CategoryScore>& categories) noexcept;

}  // namespace perf_analyzer::analysis
