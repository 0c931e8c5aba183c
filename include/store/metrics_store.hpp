#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

#include "core/bounded_history.hpp"
#include "model/metric_sample.hpp"

namespace perf_analyzer::store {

class MetricsStore {
 public:
  static constexpr std::chrono::milliseconds kDefaultWindow{60LL * 60 * 1000};

  MetricsStore(std::chrono::milliseconds retention_period, std::chrono::milliseconds sample_interval);

  // Drops samples strictly older than the retention period relative to now_ms, then appends.
  // A sample that is itself past retention is discarded.
  void add(const model::MetricSample& sample, std::uint64_t now_ms) noexcept;

  // Removes samples strictly older than the retention period; returns how many went.
  std::size_t prune(std::uint64_t now_ms) noexcept;

  // Ordered copy of samples no older than window.
  [[nodiscard]] std::vector<model::MetricSample> recent(std::uint64_t now_ms,
                                                        std::chrono::milliseconds window = kDefaultWindow) const;

  [[nodiscard]] std::optional<model::MetricSample> latest() const noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return samples_.size(); }
  [[nodiscard]] bool empty() const noexcept { return samples_.empty(); }
  [[nodiscard]] std::size_t capacity() const noexcept { return samples_.capacity(); }

 private:
  std::uint64_t retention_ms_;
  core::BoundedHistory<model::MetricSample> samples_;
};

}  // namespace perf_analyzer::store
