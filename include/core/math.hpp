#pragma once

#include <algorithm>
#include <numeric>
#include <vector>

namespace perf_analyzer::core {

inline constexpr double clamp_score(const double value) noexcept {
  return std::clamp(value, 0.0, 100.0);
}

inline double mean(const std::vector<double>& values) noexcept {
  if (values.empty()) {
    return 0.0;
  }
  return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

}  // namespace perf_analyzer::core
