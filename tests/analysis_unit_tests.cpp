#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

#include "analysis/bottleneck_detector.hpp"
#include "analysis/recommendation_engine.hpp"
#include "analysis/scorer.hpp"
#include "analysis/trend_analyzer.hpp"
#include "core/config.hpp"
#include "model/analysis.hpp"
#include "model/metric_sample.hpp"

using perf_analyzer::analysis::BottleneckDetector;
using perf_analyzer::analysis::RecommendationEngine;
using perf_analyzer::analysis::Scorer;
using perf_analyzer::analysis::TrendAnalyzer;
using perf_analyzer::analysis::auto_executable;
using perf_analyzer::analysis::overall_score;
using perf_analyzer::analysis::score;
using perf_analyzer::analysis::status_from_score;
using perf_analyzer::core::AnalyzerConfig;
using perf_analyzer::core::ScoreThreshold;
using perf_analyzer::core::ScoreThresholds;
using perf_analyzer::core::load_analyzer_config;
using perf_analyzer::model::Bottleneck;
using perf_analyzer::model::CategoryScore;
using perf_analyzer::model::MetricSample;
using perf_analyzer::model::health_status;
using perf_analyzer::model::priority;
using perf_analyzer::model::trend;

namespace {

bool almost_equal(double a, double b, double eps = 1e-6) {
  return std::fabs(a - b) <= eps;
}

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

MetricSample healthy_sample(std::uint64_t timestamp_ms) {
  MetricSample sample{};
  sample.timestamp_ms = timestamp_ms;
  sample.system.cpu = 55.0;
  sample.system.memory = 65.0;
  sample.system.disk = 70.0;
  sample.system.network_latency = 8.0;
  sample.application.response_time = 80.0;
  sample.application.throughput = 1200.0;
  sample.application.error_rate = 0.05;
  sample.application.active_connections = 150.0;
  sample.agents.total = 10.0;
  sample.agents.active = 10.0;
  sample.agents.average_health = 0.95;
  return sample;
}

std::filesystem::path write_config(const char* name, const std::string& content) {
  const auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << content;
  return path;
}

// True when loading throws std::runtime_error with expected somewhere in its message.
bool config_throws(const char* name, const std::string& content, const std::string& expected = {}) {
  const auto path = write_config(name, content);
  bool threw = false;
  try {
    (void)load_analyzer_config(path.string());
  } catch (const std::runtime_error& ex) {
    threw = std::string(ex.what()).find(expected) != std::string::npos;
  }
  std::filesystem::remove(path);
  return threw;
}

int test_lower_is_better_breakpoints() {
  const ScoreThreshold response_time{100.0, 500.0, 2000.0, true};

  if (!almost_equal(score(100.0, response_time), 100.0) || !almost_equal(score(100.5, response_time), 80.0) ||
      !almost_equal(score(500.0, response_time), 80.0) || !almost_equal(score(2000.0, response_time), 60.0)) {
    return fail("test_lower_is_better_breakpoints", "breakpoint tiers mismatch");
  }

  if (!almost_equal(score(3000.0, response_time), 20.0)) {
    return fail("test_lower_is_better_breakpoints", "linear decay past poor mismatch");
  }

  if (!almost_equal(score(4000.0, response_time), 0.0) || !almost_equal(score(50000.0, response_time), 0.0)) {
    return fail("test_lower_is_better_breakpoints", "score should floor at 0");
  }

  return 0;
}

int test_higher_is_better_breakpoints() {
  const ScoreThreshold throughput{1000.0, 500.0, 100.0, false};

  if (!almost_equal(score(1000.0, throughput), 100.0) || !almost_equal(score(999.0, throughput), 80.0) ||
      !almost_equal(score(499.0, throughput), 60.0) || !almost_equal(score(100.0, throughput), 60.0)) {
    return fail("test_higher_is_better_breakpoints", "breakpoint tiers mismatch");
  }

  if (!almost_equal(score(50.0, throughput), 20.0) || !almost_equal(score(0.0, throughput), 0.0)) {
    return fail("test_higher_is_better_breakpoints", "linear decay below poor mismatch");
  }

  return 0;
}

int test_zero_poor_threshold_scores_zero() {
  const ScoreThreshold zero{0.0, 0.0, 0.0, true};
  if (!almost_equal(score(0.0, zero), 100.0)) {
    return fail("test_zero_poor_threshold_scores_zero", "value at good should still score 100");
  }
  if (!almost_equal(score(5.0, zero), 0.0)) {
    return fail("test_zero_poor_threshold_scores_zero", "value past a zero poor breakpoint should score 0");
  }
  return 0;
}

int test_status_cutoffs() {
  if (status_from_score(90.0) != health_status::EXCELLENT || status_from_score(89.999) != health_status::GOOD ||
      status_from_score(80.0) != health_status::GOOD || status_from_score(60.0) != health_status::ACCEPTABLE ||
      status_from_score(59.999) != health_status::POOR || status_from_score(40.0) != health_status::POOR ||
      status_from_score(39.999) != health_status::CRITICAL || status_from_score(0.0) != health_status::CRITICAL) {
    return fail("test_status_cutoffs", "status tier boundaries mismatch");
  }
  return 0;
}

int test_default_cpu_threshold_is_higher_is_better() {
  const ScoreThresholds defaults{};
  if (!almost_equal(score(95.0, defaults.cpu_usage), 100.0)) {
    return fail("test_default_cpu_threshold_is_higher_is_better", "default cpu_usage should score 95% as 100");
  }

  ScoreThreshold as_load = defaults.cpu_usage;
  as_load.lower_is_better = true;
  const double flipped = score(95.0, as_load);
  if (flipped >= 40.0 || !almost_equal(flipped, 40.0 - (5.0 / 90.0) * 40.0)) {
    return fail("test_default_cpu_threshold_is_higher_is_better", "lower_is_better should turn 95% cpu into a low score");
  }
  return 0;
}

int test_category_scores_and_issues() {
  const Scorer scorer{ScoreThresholds{}};

  auto sample = healthy_sample(1000);
  sample.application.response_time = 2500.0;
  sample.application.error_rate = 10.0;
  sample.application.throughput = 1200.0;

  const auto application = scorer.score_application(sample, 1000);
  if (application.metrics.size() != 3) {
    return fail("test_category_scores_and_issues", "application should score three metrics");
  }

  // response time 2500 -> 30 (high, not critical); error rate 10 -> 0 (critical); throughput -> 100.
  if (!almost_equal(application.score, (30.0 + 100.0 + 0.0) / 3.0)) {
    return fail("test_category_scores_and_issues", "application category score mismatch");
  }
  if (application.status != health_status::POOR) {
    return fail("test_category_scores_and_issues", "application status should be poor");
  }

  bool found_slow = false;
  bool found_errors = false;
  for (const auto& issue : application.issues) {
    if (issue.id == "slow-response-time") {
      found_slow = issue.severity == priority::HIGH && issue.category == "application" && issue.detected_at_ms == 1000;
    }
    if (issue.id == "high-error-rate") {
      found_errors = issue.severity == priority::CRITICAL;
    }
  }
  if (!found_slow || !found_errors || application.issues.size() != 2) {
    return fail("test_category_scores_and_issues", "expected slow-response-time (high) and high-error-rate (critical)");
  }

  const auto network = scorer.score_network(sample, 1000);
  if (!almost_equal(network.score, 100.0) || !network.issues.empty()) {
    return fail("test_category_scores_and_issues", "150 connections should cap the network score at 100");
  }

  auto idle = sample;
  idle.agents.total = 0.0;
  idle.agents.active = 0.0;
  idle.agents.average_health = 0.5;
  const auto agents = scorer.score_agents(idle, 1000);
  if (!almost_equal(agents.score, 25.0)) {
    return fail("test_category_scores_and_issues", "agent score should average health 50 and utilization 0");
  }

  return 0;
}

int test_score_categories_requires_samples() {
  const Scorer scorer{ScoreThresholds{}};
  try {
    (void)scorer.score_categories({}, 0);
  } catch (const std::invalid_argument&) {
    const auto categories = scorer.score_categories({healthy_sample(5)}, 5);
    if (categories.size() != 5 || categories.count("resources") != 1 || categories.count("agents") != 1) {
      return fail("test_score_categories_requires_samples", "expected five categories");
    }
    for (const auto& [name, category] : categories) {
      if (category.score < 0.0 || category.score > 100.0) {
        return fail("test_score_categories_requires_samples", "category score escaped [0,100]");
      }
    }
    const double overall = overall_score(categories);
    if (overall < 0.0 || overall > 100.0) {
      return fail("test_score_categories_requires_samples", "overall score escaped [0,100]");
    }
    return 0;
  }
  return fail("test_score_categories_requires_samples", "empty window should throw");
}

int test_overall_score_is_unweighted_mean() {
  std::map<std::string, CategoryScore> categories;
  categories["a"].score = 90.0;
  categories["b"].score = 60.0;
  categories["c"].score = 30.0;
  if (!almost_equal(overall_score(categories), 60.0)) {
    return fail("test_overall_score_is_unweighted_mean", "overall should be the plain mean");
  }
  if (!almost_equal(overall_score({}), 0.0)) {
    return fail("test_overall_score_is_unweighted_mean", "no categories should score 0");
  }
  return 0;
}

int test_trend_classification() {
  if (TrendAnalyzer::classify({}) != trend::STABLE || TrendAnalyzer::classify({42.0}) != trend::STABLE) {
    return fail("test_trend_classification", "fewer than two values should be stable");
  }

  if (TrendAnalyzer::classify({10.0, 11.0, 12.0}) != trend::STABLE) {
    return fail("test_trend_classification", "no older window should be stable");
  }

  const std::vector<double> rising = {10, 10, 10, 10, 10, 12, 12, 12, 12, 12};
  const std::vector<double> falling = {10, 10, 10, 10, 10, 8, 8, 8, 8, 8};
  const std::vector<double> flat = {10, 10, 10, 10, 10, 10.9, 10.9, 10.9, 10.9, 10.9};
  if (TrendAnalyzer::classify(rising) != trend::IMPROVING) {
    return fail("test_trend_classification", "+20% should be improving");
  }
  if (TrendAnalyzer::classify(falling) != trend::DEGRADING) {
    return fail("test_trend_classification", "-20% should be degrading");
  }
  if (TrendAnalyzer::classify(flat) != trend::STABLE) {
    return fail("test_trend_classification", "+9% should be stable");
  }

  // Only the last ten values matter.
  const std::vector<double> long_series = {1000, 1000, 10, 10, 10, 10, 10, 12, 12, 12, 12, 12};
  if (TrendAnalyzer::classify(long_series) != trend::IMPROVING) {
    return fail("test_trend_classification", "values before the older window should be ignored");
  }

  const std::vector<double> from_zero = {0, 0, 0, 0, 0, 1, 1, 1, 1, 1};
  if (TrendAnalyzer::classify(from_zero) != trend::IMPROVING) {
    return fail("test_trend_classification", "zero older mean should classify by the recent sign");
  }

  return 0;
}

int test_trend_analyze_fills_categories() {
  std::vector<MetricSample> samples;
  for (std::uint64_t i = 0; i < 10; ++i) {
    auto sample = healthy_sample(i * 1000);
    sample.application.response_time = i < 5 ? 100.0 : 200.0;
    samples.push_back(sample);
  }

  const Scorer scorer{ScoreThresholds{}};
  auto categories = scorer.score_categories(samples, 9000);
  const TrendAnalyzer analyzer;
  const auto summary = analyzer.analyze(samples, categories);

  const auto& application = categories.at("application");
  if (application.direction != trend::IMPROVING ||
      application.metric_trends.at("application.responseTime") != trend::IMPROVING) {
    return fail("test_trend_analyze_fills_categories", "application should follow the response time series");
  }
  if (categories.at("system").direction != trend::STABLE || summary.categories.at("system") != trend::STABLE) {
    return fail("test_trend_analyze_fills_categories", "flat system metrics should be stable");
  }
  if (summary.categories.size() != categories.size()) {
    return fail("test_trend_analyze_fills_categories", "summary should list every category");
  }
  return 0;
}

int test_bottleneck_strict_threshold() {
  const BottleneckDetector detector{ScoreThresholds{}};

  auto at_poor = healthy_sample(0);
  at_poor.system.cpu = 90.0;
  at_poor.system.memory = 95.0;
  at_poor.application.response_time = 2000.0;
  if (!detector.detect(at_poor).empty()) {
    return fail("test_bottleneck_strict_threshold", "values equal to poor must not be bottlenecks");
  }

  auto over = at_poor;
  over.system.cpu = 91.0;
  const auto detected = detector.detect(over);
  if (detected.size() != 1 || detected.front().id != "cpu-bottleneck" || detected.front().impact != 80.0 ||
      detected.front().estimated_cost != 5000.0 || detected.front().detecting_metrics.front() != "system.cpu") {
    return fail("test_bottleneck_strict_threshold", "cpu 91 should raise exactly cpu-bottleneck");
  }

  over.system.memory = 96.0;
  over.application.response_time = 2500.0;
  if (detector.detect(over).size() != 3) {
    return fail("test_bottleneck_strict_threshold", "all three rules should fire");
  }
  return 0;
}

int test_bottleneck_rule_validation() {
  auto rules = BottleneckDetector::default_rules();
  rules.front().threshold = "gpu_usage";
  try {
    BottleneckDetector detector{ScoreThresholds{}, rules};
  } catch (const std::invalid_argument&) {
    return 0;
  }
  return fail("test_bottleneck_rule_validation", "unknown threshold key should be rejected");
}

int test_recommendations_and_dedup() {
  std::map<std::string, CategoryScore> categories;
  categories["system"].score = 50.0;
  categories["application"].score = 80.0;

  Bottleneck cpu{};
  cpu.id = "cpu-bottleneck";
  cpu.type = "cpu";
  cpu.severity = priority::HIGH;
  cpu.impact = 80.0;
  cpu.estimated_cost = 5000.0;
  cpu.detecting_metrics = {"system.cpu"};
  cpu.recommendations = {"Optimize CPU-intensive algorithms"};

  Bottleneck memory = cpu;
  memory.id = "memory-bottleneck";
  memory.severity = priority::MEDIUM;

  const RecommendationEngine engine;
  const auto recs = engine.generate(categories, {cpu, cpu, memory});
  if (recs.size() != 3) {
    return fail("test_recommendations_and_dedup", "expected system + one fix per distinct bottleneck");
  }
  if (recs[0].id != "system-optimization" || recs[1].id != "fix-cpu-bottleneck" ||
      recs[2].id != "fix-memory-bottleneck") {
    return fail("test_recommendations_and_dedup", "recommendation order mismatch");
  }

  const auto& fix = recs[1];
  if (fix.rank != priority::HIGH || !almost_equal(fix.impact.performance, 80.0) || !almost_equal(fix.impact.cost, -5.0) ||
      fix.implementation.steps != cpu.recommendations || fix.validation.metrics != cpu.detecting_metrics) {
    return fail("test_recommendations_and_dedup", "fix recommendation fields mismatch");
  }

  if (!auto_executable(recs[0]) || !auto_executable(recs[1]) || auto_executable(recs[2])) {
    return fail("test_recommendations_and_dedup", "auto gate should require priority high and risk low");
  }

  categories["application"].score = 69.9;
  const auto with_app = engine.generate(categories, {});
  if (with_app.size() != 2 || with_app[1].id != "application-optimization" || auto_executable(with_app[1])) {
    return fail("test_recommendations_and_dedup", "application-optimization should appear with medium risk");
  }
  return 0;
}

int test_metric_paths() {
  const auto sample = healthy_sample(0);
  if (perf_analyzer::model::metric_value(sample, "system.network") != 8.0 ||
      perf_analyzer::model::metric_value(sample, "agents.averageHealth") != 0.95 ||
      perf_analyzer::model::metric_value(sample, "application.latency") != 0.0) {
    return fail("test_metric_paths", "metric path lookup mismatch");
  }
  return 0;
}

int test_config_defaults_and_overrides() {
  const AnalyzerConfig defaults{};
  if (defaults.analysis_interval.count() != 60000 || defaults.optimization_targets.size() != 3 ||
      defaults.thresholds.response_time.poor != 2000.0 || defaults.auto_optimization) {
    return fail("test_config_defaults_and_overrides", "defaults mismatch");
  }

  const auto path = write_config("perf_analyzer_overrides.yaml",
                                 "analysis_interval_ms: 1000  # fast\n"
                                 "auto_optimization: yes\n"
                                 "thresholds:\n"
                                 "  cpu_usage:\n"
                                 "    poor: 85\n"
                                 "    lower_is_better: true\n"
                                 "targets:\n"
                                 "  p99:\n"
                                 "    metric: application.responseTime\n"
                                 "    target_value: 250\n"
                                 "    priority: critical\n"
                                 "    strategy: stabilize\n"
                                 "redis:\n"
                                 "  address: localhost:6380\n"
                                 "  password: hunter2\n"
                                 "  db: 3\n");
  const auto config = load_analyzer_config(path.string());
  std::filesystem::remove(path);

  if (config.analysis_interval.count() != 1000 || !config.auto_optimization) {
    return fail("test_config_defaults_and_overrides", "scalar overrides not applied");
  }
  if (config.thresholds.cpu_usage.poor != 85.0 || !config.thresholds.cpu_usage.lower_is_better ||
      config.thresholds.cpu_usage.good != 50.0) {
    return fail("test_config_defaults_and_overrides", "threshold override should only touch named fields");
  }
  if (config.optimization_targets.size() != 1 || config.optimization_targets.front().id != "p99" ||
      config.optimization_targets.front().rank != priority::CRITICAL ||
      config.optimization_targets.front().strategy != perf_analyzer::core::target_strategy::STABILIZE) {
    return fail("test_config_defaults_and_overrides", "configured targets should replace the defaults");
  }
  if (!config.redis.enabled || config.redis.host != "localhost" || config.redis.port != 6380) {
    return fail("test_config_defaults_and_overrides", "redis address not parsed");
  }
  if (config.redis.password != "hunter2" || config.redis.db != 3) {
    return fail("test_config_defaults_and_overrides", "redis credentials not parsed");
  }
  return 0;
}

int test_config_rejects_invalid_values() {
  if (!config_throws("perf_analyzer_bad_interval.yaml", "analysis_interval_ms: 0\n")) {
    return fail("test_config_rejects_invalid_values", "zero interval should throw");
  }
  if (!config_throws("perf_analyzer_bad_threshold.yaml", "thresholds:\n  gpu_usage:\n    poor: 1\n")) {
    return fail("test_config_rejects_invalid_values", "unknown threshold should throw");
  }
  if (!config_throws("perf_analyzer_negative.yaml", "thresholds:\n  cpu_usage:\n    poor: -1\n")) {
    return fail("test_config_rejects_invalid_values", "negative threshold should throw");
  }
  if (!config_throws("perf_analyzer_priority.yaml", "targets:\n  x:\n    metric: system.cpu\n    priority: urgent\n")) {
    return fail("test_config_rejects_invalid_values", "unknown priority should throw");
  }
  if (!config_throws("perf_analyzer_no_metric.yaml", "targets:\n  x:\n    target_value: 5\n")) {
    return fail("test_config_rejects_invalid_values", "target without metric should throw");
  }
  if (!config_throws("perf_analyzer_port.yaml", "redis:\n  address: localhost:99999\n")) {
    return fail("test_config_rejects_invalid_values", "bad redis port should throw");
  }
  if (!config_throws("perf_analyzer_number.yaml", "sample_interval_ms: soon\n", "sample_interval_ms must be a number")) {
    return fail("test_config_rejects_invalid_values", "non-numeric interval should throw");
  }
  if (!config_throws("perf_analyzer_overflow.yaml", "analysis_interval_ms: 99999999999999999999999\n",
                     "analysis_interval_ms must be a number")) {
    return fail("test_config_rejects_invalid_values", "out of range interval should name the key");
  }
  if (!config_throws("perf_analyzer_suffix.yaml", "thresholds:\n  cpu_usage:\n    poor: 9x\n",
                     "thresholds.cpu_usage.poor must be a number")) {
    return fail("test_config_rejects_invalid_values", "trailing garbage in a threshold should throw");
  }
  if (!config_throws("perf_analyzer_target_value.yaml", "targets:\n  x:\n    metric: system.cpu\n    target_value: fast\n",
                     "targets.x.target_value must be a number")) {
    return fail("test_config_rejects_invalid_values", "non-numeric target value should name the key");
  }
  if (!config_throws("perf_analyzer_indent.yaml", "thresholds:\n      cpu_usage:\n        poor: 95\n",
                     "unexpected indentation at line 2")) {
    return fail("test_config_rejects_invalid_values", "a section indented past its parent should throw");
  }
  if (!config_throws("perf_analyzer_db.yaml", "redis:\n  db: -1\n", "redis.db")) {
    return fail("test_config_rejects_invalid_values", "negative redis db should throw");
  }

  try {
    (void)load_analyzer_config("/nonexistent/perf-analyzer.yaml");
  } catch (const std::runtime_error&) {
    return 0;
  }
  return fail("test_config_rejects_invalid_values", "missing config file should throw");
}

}  // namespace

int main() {
  if (int rc = test_lower_is_better_breakpoints(); rc != 0) return rc;
  if (int rc = test_higher_is_better_breakpoints(); rc != 0) return rc;
  if (int rc = test_zero_poor_threshold_scores_zero(); rc != 0) return rc;
  if (int rc = test_status_cutoffs(); rc != 0) return rc;
  if (int rc = test_default_cpu_threshold_is_higher_is_better(); rc != 0) return rc;
  if (int rc = test_category_scores_and_issues(); rc != 0) return rc;
  if (int rc = test_score_categories_requires_samples(); rc != 0) return rc;
  if (int rc = test_overall_score_is_unweighted_mean(); rc != 0) return rc;
  if (int rc = test_trend_classification(); rc != 0) return rc;
  if (int rc = test_trend_analyze_fills_categories(); rc != 0) return rc;
  if (int rc = test_bottleneck_strict_threshold(); rc != 0) return rc;
  if (int rc = test_bottleneck_rule_validation(); rc != 0) return rc;
  if (int rc = test_recommendations_and_dedup(); rc != 0) return rc;
  if (int rc = test_metric_paths(); rc != 0) return rc;
  if (int rc = test_config_defaults_and_overrides(); rc != 0) return rc;
  if (int rc = test_config_rejects_invalid_values(); rc != 0) return rc;

  std::cout << "[PASS] analysis unit tests\n";
  return 0;
}
