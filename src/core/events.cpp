#include "core/events.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace perf_analyzer::core {
namespace {

template <typename Handler, typename... Args>
void dispatch(const char* event, const std::vector<Handler>& handlers, const Args&... args) {
  for (const auto& handler : handlers) {
    try {
      handler(args...);
    } catch (const std::exception& ex) {
      std::cerr << "[analyzer] " << event << " subscriber threw: " << ex.what() << '\n';
    }
  }
}

}  // namespace

void EventBus::on_initialized(LifecycleHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  initialized_.push_back(std::move(handler));
}

void EventBus::on_analysis_completed(AnalysisHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  analysis_completed_.push_back(std::move(handler));
}

void EventBus::on_analysis_failed(AnalysisFailedHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  analysis_failed_.push_back(std::move(handler));
}

void EventBus::on_optimization_completed(OptimizationHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  optimization_completed_.push_back(std::move(handler));
}

void EventBus::on_optimization_failed(OptimizationFailedHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  optimization_failed_.push_back(std::move(handler));
}

void EventBus::on_shutdown(LifecycleHandler handler) {
  std::lock_guard<std::mutex> lock(mutex_);
  shutdown_.push_back(std::move(handler));
}

void EventBus::emit_initialized() const { dispatch("analyzer:initialized", copy_handlers(initialized_)); }

void EventBus::emit_analysis_completed(const model::Analysis& analysis) const {
  dispatch("analysis:completed", copy_handlers(analysis_completed_), analysis);
}

void EventBus::emit_analysis_failed(const std::string& error) const {
  dispatch("analysis:failed", copy_handlers(analysis_failed_), error);
}

void EventBus::emit_optimization_completed(const model::ImplementedOptimization& optimization) const {
  dispatch("optimization:completed", copy_handlers(optimization_completed_), optimization);
}

void EventBus::emit_optimization_failed(const model::OptimizationRecommendation& recommendation,
                                        const std::string& error) const {
  dispatch("optimization:failed", copy_handlers(optimization_failed_), recommendation, error);
}

void EventBus::emit_shutdown() const { dispatch("analyzer:shutdown", copy_handlers(shutdown_)); }

}  // namespace perf_analyzer::core
