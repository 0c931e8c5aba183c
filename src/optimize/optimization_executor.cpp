#include "optimize/optimization_executor.hpp"

#include <cmath>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace perf_analyzer::optimize {

model::MetricMap capture_metrics(const std::optional<model::MetricSample>& latest) {
  if (!latest.has_value()) {
    return {};
  }

  return {
      {"system.cpu", latest->system.cpu},
      {"system.memory", latest->system.memory},
      {"application.responseTime", latest->application.response_time},
      {"application.throughput", latest->application.throughput},
      {"application.errorRate", latest->application.error_rate},
  };
}

model::MetricMap compute_improvement(const model::MetricMap& before, const model::MetricMap& after) {
  model::MetricMap improvement;
  for (const auto& [metric, before_value] : before) {
    const auto it = after.find(metric);
    if (it == after.end() || !std::isfinite(before_value) || !std::isfinite(it->second)) {
      continue;
    }
    improvement[metric] = it->second - before_value;
  }
  return improvement;
}

OptimizationExecutor::OptimizationExecutor(std::shared_ptr<StepExecutor> steps, std::shared_ptr<core::Clock> clock,
                                           const std::chrono::milliseconds stabilization_delay,
                                           const bool debug_logging)
    : steps_(std::move(steps)),
      clock_(std::move(clock)),
      stabilization_delay_(stabilization_delay),
      debug_logging_(debug_logging) {
  if (steps_ == nullptr || clock_ == nullptr) {
    throw std::invalid_argument("optimization executor requires a step executor and a clock");
  }
}

model::ImplementedOptimization OptimizationExecutor::execute(const model::OptimizationRecommendation& recommendation,
                                                             const MetricsSnapshotFn& capture) const {
  std::cerr << "[optimize] executing " << recommendation.id << " (" << recommendation.title << ")\n";

  const model::MetricMap before = capture();

  std::size_t failed_steps = 0;
  for (const auto& step : recommendation.implementation.steps) {
    if (!steps_->execute(recommendation.id, step)) {
      ++failed_steps;
      std::cerr << "[optimize] " << recommendation.id << ": step failed \"" << step << "\"\n";
    }
  }

  if (debug_logging_) {
    std::cerr << "[optimize] " << recommendation.id << ": waiting " << stabilization_delay_.count()
              << "ms for metrics to settle\n";
  }
  clock_->sleep_for(stabilization_delay_);

  const model::MetricMap after = capture();
  const std::size_t total_steps = recommendation.implementation.steps.size();

  model::ImplementedOptimization result{};
  result.id = recommendation.id;
  result.name = recommendation.title;
  result.implemented_at_ms = clock_->now_ms();
  result.category = recommendation.category;
  result.before = before;
  result.after = after;
  result.improvement = compute_improvement(before, after);
  result.cost = std::fabs(recommendation.impact.cost);
  result.effort = recommendation.effort.implementation;

  if (failed_steps == 0) {
    result.status = model::optimization_status::SUCCESS;
    result.notes = "Optimization executed successfully";
  } else if (failed_steps < total_steps) {
    result.status = model::optimization_status::PARTIAL;
    result.notes = std::to_string(failed_steps) + " of " + std::to_string(total_steps) + " steps failed";
  } else {
    result.status = model::optimization_status::FAILED;
    result.notes = "All implementation steps failed";
  }

  double total_improvement = 0.0;
  for (const auto& [metric, delta] : result.improvement) {
    total_improvement += delta;
  }
  std::cerr << "[optimize] " << recommendation.id << " finished | status=" << model::to_string(result.status)
            << " | improvement=" << total_improvement << '\n';

  return result;
}

}  // namespace perf_analyzer::optimize
