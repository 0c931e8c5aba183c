#include "analysis/trend_analyzer.hpp"

#include <iterator>
#include <numeric>
#include <unordered_map>

namespace perf_analyzer::analysis {
namespace {

double mean_of(std::vector<double>::const_iterator begin, std::vector<double>::const_iterator end) {
  const auto count = std::distance(begin, end);
  if (count <= 0) {
    return 0.0;
  }
  return std::accumulate(begin, end, 0.0) / static_cast<double>(count);
}

const std::vector<std::string>& empty_paths() {
  static const std::vector<std::string> kEmpty{};
  return kEmpty;
}

const std::vector<std::string> kOverallComposite = {"system.cpu", "system.memory", "application.responseTime"};

}  // namespace

model::trend TrendAnalyzer::classify(const std::vector<double>& values) noexcept {
  if (values.size() < 2) {
    return model::trend::STABLE;
  }

  const std::size_t recent_count = values.size() < kWindow ? values.size() : kWindow;
  const std::size_t remaining = values.size() - recent_count;
  const std::size_t older_count = remaining < kWindow ? remaining : kWindow;
  if (older_count == 0) {
    return model::trend::STABLE;
  }

  const auto recent_begin = values.end() - static_cast<std::ptrdiff_t>(recent_count);
  const auto older_begin = recent_begin - static_cast<std::ptrdiff_t>(older_count);
  const double recent_avg = mean_of(recent_begin, values.end());
  const double older_avg = mean_of(older_begin, recent_begin);

  if (older_avg == 0.0) {
    if (recent_avg > 0.0) {
      return model::trend::IMPROVING;
    }
    if (recent_avg < 0.0) {
      return model::trend::DEGRADING;
    }
    return model::trend::STABLE;
  }

  const double change = (recent_avg - older_avg) / older_avg;
  if (change > kChangeThreshold) {
    return model::trend::IMPROVING;
  }
  if (change < -kChangeThreshold) {
    return model::trend::DEGRADING;
  }
  return model::trend::STABLE;
}

std::vector<double> TrendAnalyzer::series(const std::vector<model::MetricSample>& samples, const std::string& path) {
  std::vector<double> values;
  values.reserve(samples.size());
  for (const auto& sample : samples) {
    values.push_back(model::metric_value(sample, path));
  }
  return values;
}

std::vector<double> TrendAnalyzer::composite_series(const std::vector<model::MetricSample>& samples,
                                                    const std::vector<std::string>& paths) {
  std::vector<double> values;
  if (paths.empty()) {
    return values;
  }

  values.reserve(samples.size());
  for (const auto& sample : samples) {
    double sum = 0.0;
    for (const auto& path : paths) {
      sum += model::metric_value(sample, path);
    }
    values.push_back(sum / static_cast<double>(paths.size()));
  }
  return values;
}

std::map<std::string, model::trend> TrendAnalyzer::metric_trends(const std::vector<model::MetricSample>& samples,
                                                                 const std::vector<std::string>& paths) {
  std::map<std::string, model::trend> trends;
  for (const auto& path : paths) {
    trends[path] = classify(series(samples, path));
  }
  return trends;
}

model::TrendSummary TrendAnalyzer::analyze(const std::vector<model::MetricSample>& samples,
                                           std::map<std::string, model::CategoryScore>& categories) const {
  model::TrendSummary summary{};
  summary.overall = classify(composite_series(samples, kOverallComposite));

  for (auto& [name, category] : categories) {
    category.metric_trends = metric_trends(samples, tracked_paths(name));
    category.direction = classify(composite_series(samples, composite_paths(name)));
    summary.categories[name] = category.direction;
  }
  return summary;
}

const std::vector<std::string>& TrendAnalyzer::tracked_paths(const std::string& category) {
  static const std::unordered_map<std::string, std::vector<std::string>> kTracked = {
      {"system", {"system.cpu", "system.memory"}},
      {"application", {"application.responseTime", "application.throughput", "application.errorRate"}},
      {"resources", {"system.disk", "system.network"}},
      {"network", {"application.activeConnections"}},
      {"agents", {"agents.averageHealth", "agents.active"}},
  };
  const auto it = kTracked.find(category);
  return it != kTracked.end() ? it->second : empty_paths();
}

const std::vector<std::string>& TrendAnalyzer::composite_paths(const std::string& category) {
  // application follows response time alone; the other categories average their tracked metrics.
  static const std::vector<std::string> kApplication = {"application.responseTime"};
  if (category == "application") {
    return kApplication;
  }
  return tracked_paths(category);
}

}  // namespace perf_analyzer::analysis
