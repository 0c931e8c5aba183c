#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "model/analysis.hpp"

namespace perf_analyzer::core {

// Typed subscriber lists for the analyzer's lifecycle. Handlers run on the emitting thread;
// a handler that throws is logged and the remaining handlers still run.
class EventBus {
 public:
  using LifecycleHandler = std::function<void()>;
  using AnalysisHandler = std::function<void(const model::Analysis&)>;
  using AnalysisFailedHandler = std::function<void(const std::string& error)>;
  using OptimizationHandler = std::function<void(const model::ImplementedOptimization&)>;
  using OptimizationFailedHandler =
      std::function<void(const model::OptimizationRecommendation&, const std::string& error)>;

  void on_initialized(LifecycleHandler handler);
  void on_analysis_completed(AnalysisHandler handler);
  void on_analysis_failed(AnalysisFailedHandler handler);
  void on_optimization_completed(OptimizationHandler handler);
  void on_optimization_failed(OptimizationFailedHandler handler);
  void on_shutdown(LifecycleHandler handler);

  void emit_initialized() const;
  void emit_analysis_completed(const model::Analysis& analysis) const;
  void emit_analysis_failed(const std::string& error) const;
  void emit_optimization_completed(const model::ImplementedOptimization& optimization) const;
  void emit_optimization_failed(const model::OptimizationRecommendation& recommendation,
                                const std::string& error) const;
  void emit_shutdown() const;

 private:
  template <typename Handler>
  std::vector<Handler> copy_handlers(const std::vector<Handler>& handlers) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers;
  }

  mutable std::mutex mutex_;
  std::vector<LifecycleHandler> initialized_{};
  std::vector<AnalysisHandler> analysis_completed_{};
  std::vector<AnalysisFailedHandler> analysis_failed_{};
  std::vector<OptimizationHandler> optimization_completed_{};
  std::vector<OptimizationFailedHandler> optimization_failed_{};
  std::vector<LifecycleHandler> shutdown_{};
};

}  // namespace perf_analyzer::core
