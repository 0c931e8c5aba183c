#pragma once

#include <functional>
#include <string>
#include <unordered_map>

namespace perf_analyzer::optimize {

// Capability that performs one named implementation step of a recommendation.
// Returning false marks the step failed; throwing aborts the whole optimization.
class StepExecutor {
 public:
  virtual bool execute(const std::string& recommendation_id, const std::string& step) = 0;
  virtual ~StepExecutor() = default;
};

// Dispatches steps by name. Steps without a handler are advisory: logged and counted as done.
class StepRegistry final : public StepExecutor {
 public:
  using StepHandler = std::function<bool(const std::string& recommendation_id)>;

  explicit StepRegistry(bool debug_logging = false);

  void register_step(std::string step, StepHandler handler);
  [[nodiscard]] bool has_handler(const std::string& step) const;

  bool execute(const std::string& recommendation_id, const std::string& step) override;

 private:
  bool debug_logging_;
  std::unordered_map<std::string, StepHandler> handlers_{};
};

}  // namespace perf_analyzer::optimize
