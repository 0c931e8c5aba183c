#include "optimize/step_executor.hpp"

#include <iostream>
#include <utility>

namespace perf_analyzer::optimize {

StepRegistry::StepRegistry(const bool debug_logging) : debug_logging_(debug_logging) {}

void StepRegistry::register_step(std::string step, StepHandler handler) {
  handlers_[std::move(step)] = std::move(handler);
}

bool StepRegistry::has_handler(const std::string& step) const { return handlers_.find(step) != handlers_.end(); }

bool StepRegistry::execute(const std::string& recommendation_id, const std::string& step) {
  const auto it = handlers_.find(step);
  if (it == handlers_.end()) {
    if (debug_logging_) {
      std::cerr << "[optimize] " << recommendation_id << ": advisory step \"" << step << "\"\n";
    }
    return true;
  }

  if (debug_logging_) {
    std::cerr << "[optimize] " << recommendation_id << ": executing step \"" << step << "\"\n";
  }
  return it->second(recommendation_id);
}

}  // namespace perf_analyzer::optimize
