#include "core/clock.hpp"

#include <thread>

#include "core/timestamp.hpp"

namespace perf_analyzer::core {

std::uint64_t SystemClock::now_ms() const { return unix_timestamp_now_ms(); }

void SystemClock::sleep_for(const std::chrono::milliseconds duration) {
  if (duration.count() > 0) {
    std::this_thread::sleep_for(duration);
  }
}

std::shared_ptr<Clock> make_system_clock() { return std::make_shared<SystemClock>(); }

}  // namespace perf_analyzer::core
