#include "report/report_builder.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <utility>
#include <unordered_set>

namespace perf_analyzer::report {
namespace {

constexpr double kLowOverallScore = 70.0;

bool target_met(const core::OptimizationTarget& target, const double current,
                const std::optional<model::Analysis>& analysis) {
  switch (target.strategy) {
    case core::target_strategy::REDUCE:
      return current <= target.target_value;
    case core::target_strategy::INCREASE:
      return current >= target.target_value;
    case core::target_strategy::STABILIZE:
      if (!analysis.has_value()) {
        return false;
      }
      for (const auto& [name, category] : analysis->categories) {
        const auto it = category.metric_trends.find(target.metric);
        if (it != category.metric_trends.end()) {
          return it->second == model::trend::STABLE;
        }
      }
      return false;
  }
  return false;
}

}  // namespace

model::Roi compute_roi(const std::vector<model::ImplementedOptimization>& history) noexcept {
  model::Roi roi{};
  for (const auto& optimization : history) {
    roi.total_investment += optimization.cost;
    for (const auto& [metric, delta] : optimization.improvement) {
      roi.total_savings += delta;
    }
  }

  roi.payback_period = roi.total_savings > 0.0 ? roi.total_investment / roi.total_savings : 0.0;
  roi.roi = roi.total_investment > 0.0 ? (roi.total_savings / roi.total_investment) * 100.0 : 0.0;
  return roi;
}

std::vector<model::PlannedOptimization> plan_optimizations(
    const std::vector<model::OptimizationRecommendation>& recommendations,
    const std::vector<model::ImplementedOptimization>& history) {
  std::unordered_set<std::string> implemented;
  for (const auto& optimization : history) {
    implemented.insert(optimization.id);
  }

  std::vector<model::PlannedOptimization> planned;
  for (const auto& recommendation : recommendations) {
    if (implemented.count(recommendation.id) != 0) {
      continue;
    }

    model::PlannedOptimization entry{};
    entry.id = recommendation.id;
    entry.name = recommendation.title;
    entry.category = recommendation.category;
    entry.expected_impact = {
        {"performance", recommendation.impact.performance},
        {"cost", recommendation.impact.cost},
        {"reliability", recommendation.impact.reliability},
        {"maintainability", recommendation.impact.maintainability},
    };
    entry.estimated_cost = std::fabs(recommendation.impact.cost);
    entry.estimated_effort = recommendation.effort.implementation;
    entry.rank = recommendation.rank;
    entry.dependencies = recommendation.implementation.dependencies;
    entry.risks = recommendation.risk.factors;
    planned.push_back(std::move(entry));
  }
  return planned;
}

std::vector<model::TargetProgress> evaluate_targets(const std::vector<core::OptimizationTarget>& targets,
                                                    const std::optional<model::MetricSample>& latest,
                                                    const std::optional<model::Analysis>& analysis) {
  std::vector<model::TargetProgress> progress;
  progress.reserve(targets.size());
  for (const auto& target : targets) {
    model::TargetProgress entry{};
    entry.id = target.id;
    entry.metric = target.metric;
    entry.target_value = target.target_value;
    if (latest.has_value()) {
      entry.current_value = model::metric_value(*latest, target.metric);
      entry.met = target_met(target, entry.current_value, analysis);
    }
    progress.push_back(std::move(entry));
  }
  return progress;
}

std::vector<std::string> next_steps(const std::optional<model::Analysis>& analysis,
                                    const std::vector<core::OptimizationTarget>& targets,
                                    const std::vector<model::TargetProgress>& progress) {
  std::vector<std::string> steps;

  if (analysis.has_value()) {
    if (analysis->overall_score < kLowOverallScore) {
      steps.emplace_back("Prioritize high-impact optimization recommendations");
    }
    if (!analysis->bottlenecks.empty()) {
      steps.emplace_back("Address identified bottlenecks starting with highest impact");
    }
    if (!analysis->recommendations.empty()) {
      steps.emplace_back("Implement top 3 optimization recommendations");
    }
  }

  for (const auto& entry : progress) {
    if (entry.met) {
      continue;
    }
    const auto target = std::find_if(targets.begin(), targets.end(),
                                     [&entry](const core::OptimizationTarget& t) { return t.id == entry.id; });
    const char* strategy = target != targets.end() ? core::to_string(target->strategy) : "reduce";

    std::ostringstream step;
    step << "Work toward target " << entry.id << ": " << strategy << ' ' << entry.metric << " (current "
         << entry.current_value << ", target " << entry.target_value << ")";
    steps.push_back(step.str());
  }

  steps.emplace_back("Continue monitoring and analysis");
  return steps;
}

model::OptimizationReport build_report(const ReportInputs& inputs) {
  model::OptimizationReport report{};
  report.timestamp_ms = inputs.timestamp_ms;
  report.analysis = inputs.analysis;
  report.implemented = inputs.history;
  if (inputs.analysis.has_value()) {
    report.planned = plan_optimizations(inputs.analysis->recommendations, inputs.history);
  }
  report.targets = evaluate_targets(inputs.targets, inputs.latest, inputs.analysis);
  report.roi = compute_roi(inputs.history);
  report.next_steps = next_steps(inputs.analysis, inputs.targets, report.targets);
  return report;
}

}  // namespace perf_analyzer::report
