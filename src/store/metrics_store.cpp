#include "store/metrics_store.hpp"

namespace perf_analyzer::store {
namespace {

std::uint64_t cutoff_for(const std::uint64_t now_ms, const std::uint64_t age_ms) {
  return now_ms > age_ms ? now_ms - age_ms : 0;
}

std::size_t capacity_for(const std::chrono::milliseconds retention, const std::chrono::milliseconds interval) {
  const auto interval_ms = interval.count() > 0 ? interval.count() : 1;
  const auto retention_ms = retention.count() > 0 ? retention.count() : 0;
  return static_cast<std::size_t>(retention_ms / interval_ms) + 1;
}

}  // namespace

MetricsStore::MetricsStore(const std::chrono::milliseconds retention_period,
                           const std::chrono::milliseconds sample_interval)
    : retention_ms_(static_cast<std::uint64_t>(retention_period.count() > 0 ? retention_period.count() : 0)),
      samples_(capacity_for(retention_period, sample_interval)) {}

void MetricsStore::add(const model::MetricSample& sample, const std::uint64_t now_ms) noexcept {
  prune(now_ms);
  // Already outside retention; pushing it would only evict a live sample.
  if (sample.timestamp_ms < cutoff_for(now_ms, retention_ms_)) {
    return;
  }
  samples_.push(sample);
}

std::size_t MetricsStore::prune(const std::uint64_t now_ms) noexcept {
  const std::uint64_t cutoff = cutoff_for(now_ms, retention_ms_);
  return samples_.prune_if([cutoff](const model::MetricSample& s) { return s.timestamp_ms < cutoff; });
}

std::vector<model::MetricSample> MetricsStore::recent(const std::uint64_t now_ms,
                                                      const std::chrono::milliseconds window) const {
  const std::uint64_t cutoff = cutoff_for(now_ms, static_cast<std::uint64_t>(window.count()));
  return samples_.copy_if([cutoff](const model::MetricSample& s) { return s.timestamp_ms >= cutoff; });
}

std::optional<model::MetricSample> MetricsStore::latest() const noexcept {
  const auto* last = samples_.back();
  if (last == nullptr) {
    return std::nullopt;
  }
  return *last;
}

}  // namespace perf_analyzer::store
