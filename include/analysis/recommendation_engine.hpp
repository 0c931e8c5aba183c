#pragma once

#include <map>
#include <string>
#include <vector>

#include "model/analysis.hpp"

namespace perf_analyzer::analysis {

class RecommendationEngine {
 public:
  static constexpr double kCategoryScoreFloor = 70.0;

  // Category recommendations first, then one fix-<id> entry per distinct bottleneck id.
  [[nodiscard]] std::vector<model::OptimizationRecommendation> generate(
      const std::map<std::string, model::CategoryScore>& categories,
      const std::vector<model::Bottleneck>& bottlenecks) const;

  [[nodiscard]] static model::OptimizationRecommendation system_optimization();
  [[nodiscard]] static model::OptimizationRecommendation application_optimization();
  [[nodiscard]] static model::OptimizationRecommendation for_bottleneck(const model::Bottleneck& bottleneck);
};

// priority high and risk low: the only recommendations the scheduler may run unattended.
bool auto_executable(const model::OptimizationRecommendation& recommendation) noexcept;

}  // namespace perf_analyzer::analysis
