#pragma once

#include <chrono>
#include <cstdint>
#include <memory>

namespace perf_analyzer::core {

// Wall-clock source for sample ages and record timestamps, plus the suspension used
// while an optimization's metrics settle.
class Clock {
 public:
  virtual std::uint64_t now_ms() const = 0;
  virtual void sleep_for(std::chrono::milliseconds duration) = 0;
  virtual ~Clock() = default;
};

class SystemClock final : public Clock {
 public:
  std::uint64_t now_ms() const override;
  void sleep_for(std::chrono::milliseconds duration) override;
};

std::shared_ptr<Clock> make_system_clock();

}  // namespace perf_analyzer::core
