#include "analysis/scorer.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <utility>

#include "core/math.hpp"

namespace perf_analyzer::analysis {
namespace {

struct IssueTemplate {
  const char* id;
  const char* title;
  const char* description_format;
  const char* impact;
  std::vector<std::string> correlations;
};

std::string format_value(const char* format, const double value) {
  char buffer[128]{};
  std::snprintf(buffer, sizeof(buffer), format, value);
  return buffer;
}

class CategoryBuilder {
 public:
  CategoryBuilder(const char* category, const std::uint64_t now_ms) : category_(category), now_ms_(now_ms) {}

  void add(const char* name, const char* path, const double value, const double metric_score,
           const IssueTemplate& issue) {
    const double clamped = core::clamp_score(metric_score);
    result_.metrics.push_back({name, path, value, clamped});

    if (clamped >= Scorer::kIssueScore) {
      return;
    }

    model::PerformanceIssue performance_issue{};
    performance_issue.id = issue.id;
    performance_issue.category = category_;
    performance_issue.severity =
        clamped < Scorer::kCriticalIssueScore ? model::priority::CRITICAL : model::priority::HIGH;
    performance_issue.title = issue.title;
    performance_issue.description = format_value(issue.description_format, value);
    performance_issue.impact = issue.impact;
    performance_issue.detected_at_ms = now_ms_;
    performance_issue.affected_metrics = {path};
    performance_issue.correlations = issue.correlations;
    result_.issues.push_back(std::move(performance_issue));
  }

  model::CategoryScore finish() {
    std::vector<double> scores;
    scores.reserve(result_.metrics.size());
    for (const auto& metric : result_.metrics) {
      scores.push_back(metric.score);
    }
    result_.score = core::clamp_score(core::mean(scores));
    result_.status = status_from_score(result_.score);
    return std::move(result_);
  }

 private:
  const char* category_;
  std::uint64_t now_ms_;
  model::CategoryScore result_{};
};

}  // namespace

double score(const double value, const core::ScoreThreshold& threshold) noexcept {
  const double good = threshold.good;
  const double acceptable = threshold.acceptable;
  const double poor = threshold.poor;

  if (threshold.lower_is_better) {
    if (value <= good) {
      return 100.0;
    }
    if (value <= acceptable) {
      return 80.0;
    }
    if (value <= poor) {
      return 60.0;
    }
    if (poor <= 0.0) {
      return 0.0;
    }
    return core::clamp_score(std::max(0.0, 40.0 - ((value - poor) / poor) * 40.0));
  }

  if (value >= good) {
    return 100.0;
  }
  if (value >= acceptable) {
    return 80.0;
  }
  if (value >= poor) {
    return 60.0;
  }
  if (poor <= 0.0) {
    return 0.0;
  }
  return core::clamp_score(std::max(0.0, 40.0 - ((poor - value) / poor) * 40.0));
}

model::health_status status_from_score(const double score) noexcept {
  if (score >= 90.0) {
    return model::health_status::EXCELLENT;
  }
  if (score >= 80.0) {
    return model::health_status::GOOD;
  }
  if (score >= 60.0) {
    return model::health_status::ACCEPTABLE;
  }
  if (score >= 40.0) {
    return model::health_status::POOR;
  }
  return model::health_status::CRITICAL;
}

Scorer::Scorer(core::ScoreThresholds thresholds) : thresholds_(std::move(thresholds)) {}

model::CategoryScore Scorer::score_system(const model::MetricSample& latest, const std::uint64_t now_ms) const {
  CategoryBuilder builder("system", now_ms);
  builder.add("CPU Usage", "system.cpu", latest.system.cpu, score(latest.system.cpu, thresholds_.cpu_usage),
              {"high-cpu-usage", "High CPU Usage", "CPU usage is %.1f%%", "Reduced system responsiveness and throughput",
               {"response-time", "throughput"}});
  builder.add("Memory Usage", "system.memory", latest.system.memory,
              score(latest.system.memory, thresholds_.memory_usage),
              {"high-memory-usage", "High Memory Usage", "Memory usage is %.1f%%",
               "Risk of memory exhaustion and system instability", {"gc-pressure", "response-time"}});
  return builder.finish();
}

model::CategoryScore Scorer::score_application(const model::MetricSample& latest, const std::uint64_t now_ms) const {
  const auto& app = latest.application;
  CategoryBuilder builder("application", now_ms);
  builder.add("Response Time", "application.responseTime", app.response_time,
              score(app.response_time, thresholds_.response_time),
              {"slow-response-time", "Slow Response Time", "Response time is %.1fms",
               "Poor user experience and reduced throughput", {"cpu-usage", "memory-usage", "queue-depth"}});
  builder.add("Throughput", "application.throughput", app.throughput, score(app.throughput, thresholds_.throughput),
              {"low-throughput", "Low Throughput", "Throughput is %.1f ops/min", "Work is backing up behind the service",
               {"response-time", "resource-contention"}});
  builder.add("Error Rate", "application.errorRate", app.error_rate, score(app.error_rate, thresholds_.error_rate),
              {"high-error-rate", "High Error Rate", "Error rate is %.1f%%", "Reduced reliability and user satisfaction",
               {"resource-exhaustion", "external-dependencies"}});
  return builder.finish();
}

model::CategoryScore Scorer::score_resources(const model::MetricSample& latest, const std::uint64_t now_ms) const {
  CategoryBuilder builder("resources", now_ms);
  builder.add("Disk Usage", "system.disk", latest.system.disk, score(latest.system.disk, thresholds_.disk_usage),
              {"high-disk-usage", "High Disk Usage", "Disk usage is %.1f%%", "Risk of disk full and system failure",
               {"log-retention", "data-growth"}});
  builder.add("Network Latency", "system.network", latest.system.network_latency,
              score(latest.system.network_latency, thresholds_.network_latency),
              {"high-network-latency", "High Network Latency", "Network latency is %.1fms",
               "Slow remote calls and cascading timeouts", {"response-time", "external-dependencies"}});
  return builder.finish();
}

model::CategoryScore Scorer::score_network(const model::MetricSample& latest, const std::uint64_t now_ms) const {
  const double connections = latest.application.active_connections;
  CategoryBuilder builder("network", now_ms);
  builder.add("Active Connections", "application.activeConnections", connections,
              std::min(100.0, (connections / 100.0) * 100.0),
              {"low-connection-count", "Low Connection Count", "Only %.0f active connections",
               "Clients may be failing to connect or being shed", {"throughput", "error-rate"}});
  return builder.finish();
}

model::CategoryScore Scorer::score_agents(const model::MetricSample& latest, const std::uint64_t now_ms) const {
  const auto& agents = latest.agents;
  const double health = agents.average_health * 100.0;
  const double utilization = agents.total > 0.0 ? (agents.active / agents.total) * 100.0 : 0.0;

  CategoryBuilder builder("agents", now_ms);
  builder.add("Agent Health", "agents.averageHealth", health, health,
              {"poor-agent-health", "Poor Agent Health", "Average agent health is %.1f%%",
               "Reduced task execution efficiency and reliability", {"resource-contention", "task-complexity"}});
  builder.add("Agent Utilization", "agents.active", utilization, utilization,
              {"low-agent-utilization", "Low Agent Utilization", "Agent utilization is %.1f%%",
               "Provisioned agents are sitting idle", {"task-distribution", "queue-depth"}});
  return builder.finish();
}

std::map<std::string, model::CategoryScore> Scorer::score_categories(const std::vector<model::MetricSample>& window,
                                                                     const std::uint64_t now_ms) const {
  if (window.empty()) {
    throw std::invalid_argument("cannot score an empty metrics window");
  }

  const auto& latest = window.back();
  std::map<std::string, model::CategoryScore> categories;
  categories.emplace("system", score_system(latest, now_ms));
  categories.emplace("application", score_application(latest, now_ms));
  categories.emplace("resources", score_resources(latest, now_ms));
  categories.emplace("network", score_network(latest, now_ms));
  categories.emplace("agents", score_agents(latest, now_ms));
  return categories;
}

double overall_score(const std::map<std::string, model::CategoryScore>& categories) noexcept {
  if (categories.empty()) {
    return 0.0;
  }
  double sum = 0.0;
  for (const auto& [name, category] : categories) {
    sum += category.score;
  }
  return core::clamp_score(sum / static_cast<double>(categories.size()));
}

}  // namespace perf_analyzer::analysis
