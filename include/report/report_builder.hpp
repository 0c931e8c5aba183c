#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "model/analysis.hpp"
#include "model/metric_sample.hpp"
#include "model/report.hpp"

namespace perf_analyzer::report {

// Everything the report is derived from, copied out of the analyzer under its lock.
struct ReportInputs {
  std::uint64_t timestamp_ms{0};
  std::optional<model::Analysis> analysis;
  std::optional<model::MetricSample> latest;
  std::vector<model::ImplementedOptimization> history;
  std::vector<core::OptimizationTarget> targets;
};

model::Roi compute_roi(const std::vector<model::ImplementedOptimization>& history) noexcept;

// Current recommendations whose id has not been implemented yet.
std::vector<model::PlannedOptimization> plan_optimizations(
    const std::vector<model::OptimizationRecommendation>& recommendations,
    const std::vector<model::ImplementedOptimization>& history);

std::vector<model::TargetProgress> evaluate_targets(const std::vector<core::OptimizationTarget>& targets,
                                                    const std::optional<model::MetricSample>& latest,
                                                    const std::optional<model::Analysis>& analysis);

std::vector<std::string> next_steps(const std::optional<model::Analysis>& analysis,
                                    const std::vector<core::OptimizationTarget>& targets,
                                    const std::vector<model::TargetProgress>& progress);

model::OptimizationReport build_report(const ReportInputs& inputs);

}  // namespace perf_analyzer::report
