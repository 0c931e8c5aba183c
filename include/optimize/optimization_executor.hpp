#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include "core/clock.hpp"
#include "model/analysis.hpp"
#include "model/metric_sample.hpp"
#include "optimize/step_executor.hpp"

namespace perf_analyzer::optimize {

using MetricsSnapshotFn = std::function<model::MetricMap()>;

// system.cpu, system.memory and the three application rates of the latest sample; empty without one.
model::MetricMap capture_metrics(const std::optional<model::MetricSample>& latest);

// after - before for every metric present in both snapshots.
model::MetricMap compute_improvement(const model::MetricMap& before, const model::MetricMap& after);

class OptimizationExecutor {
 public:
  OptimizationExecutor(std::shared_ptr<StepExecutor> steps, std::shared_ptr<core::Clock> clock,
                       std::chrono::milliseconds stabilization_delay, bool debug_logging = false);

  // Runs the steps in order, waits for the stabilization delay and measures again.
  // Exceptions from a step or a snapshot propagate; nothing is recorded for that attempt.
  model::ImplementedOptimization execute(const model::OptimizationRecommendation& recommendation,
                                         const MetricsSnapshotFn& capture) const;

  [[nodiscard]] std::chrono::milliseconds stabilization_delay() const noexcept { return stabilization_delay_; }

 private:
  std::shared_ptr<StepExecutor> steps_;
  std::shared_ptr<core::Clock> clock_;
  std::chrono::milliseconds stabilization_delay_;
  bool debug_logging_;
};

}  // namespace perf_analyzer::optimize
