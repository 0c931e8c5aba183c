#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "model/analysis.hpp"
#include "model/metric_sample.hpp"

namespace perf_analyzer::analysis {

class TrendAnalyzer {
 public:
  static constexpr std::size_t kWindow = 5;
  static constexpr double kChangeThreshold = 0.10;

  // Compares the mean of the last kWindow values with the mean of the kWindow before them.
  [[nodiscard]] static model::trend classify(const std::vector<double>& values) noexcept;

  [[nodiscard]] static std::vector<double> series(const std::vector<model::MetricSample>& samples,
                                                  const std::string& path);

  // Per-sample mean of several metric paths.
  [[nodiscard]] static std::vector<double> composite_series(const std::vector<model::MetricSample>& samples,
                                                            const std::vector<std::string>& paths);

  [[nodiscard]] static std::map<std::string, model::trend> metric_trends(
      const std::vector<model::MetricSample>& samples, const std::vector<std::string>& paths);

  // Fills each category's direction and metric_trends and returns the overall summary.
  model::TrendSummary analyze(const std::vector<model::MetricSample>& samples,
                              std::map<std::string, model::CategoryScore>& categories) const;

  [[nodiscard]] static const std::vector<std::string>& tracked_paths(const std::string& category);
  [[nodiscard]] static const std::vector<std::string>& composite_paths(const std::string& category);
};

}  // namespace perf_analyzer::analysis
