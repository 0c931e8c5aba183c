#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "analysis/bottleneck_detector.hpp"
#include "analysis/recommendation_engine.hpp"
#include "analysis/scorer.hpp"
#include "analysis/trend_analyzer.hpp"
#include "bench/benchmark_runner.hpp"
#include "core/bounded_history.hpp"
#include "core/clock.hpp"
#include "core/config.hpp"
#include "core/events.hpp"
#include "model/analysis.hpp"
#include "model/metric_sample.hpp"
#include "model/report.hpp"
#include "optimize/optimization_executor.hpp"
#include "optimize/step_executor.hpp"
#include "persist/state_store.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"
#include "store/metrics_store.hpp"

namespace perf_analyzer::core {

// Owns the metric history and drives the periodic analysis cycle:
// score -> trend -> detect -> recommend -> benchmark -> assemble -> history -> prune -> emit -> auto-optimize.
// Ingest and query calls are safe from any thread; queries return copies.
class Analyzer {
 public:
  static constexpr std::size_t kOptimizationHistoryCapacity = 1000;
  static constexpr std::size_t kBenchmarksPerCycle = 8;

  explicit Analyzer(AnalyzerConfig config, std::shared_ptr<Clock> clock = make_system_clock(),
                    std::shared_ptr<optimize::StepExecutor> steps = nullptr);
  ~Analyzer();

  Analyzer(const Analyzer&) = delete;
  Analyzer& operator=(const Analyzer&) = delete;

  // Loads the baseline, runs the initial benchmarks, starts the timer and emits analyzer:initialized.
  void initialize();

  void add_metrics(const model::MetricSample& sample) noexcept;

  // One analysis cycle. false when skipped (another cycle running, no samples) or failed.
  bool run_cycle();

  // Runs a recommendation outside the auto-optimization gate. nullopt when it threw.
  // Safe to call from an event subscriber.
  std::optional<model::ImplementedOptimization> execute_optimization(
      const model::OptimizationRecommendation& recommendation);

  bool reload_baseline();

  // Stops the timer, persists history and baseline, writes the final report and emits the final analysis.
  void shutdown();

  void register_benchmark(std::string name, bench::BenchmarkFn run);

  // Extends the bottleneck table for later cycles. false (and logged) when the rule names an unknown threshold.
  bool register_bottleneck_rule(analysis::BottleneckRule rule);

  [[nodiscard]] std::optional<model::Analysis> current_analysis() const;
  [[nodiscard]] std::vector<model::OptimizationRecommendation> optimization_recommendations() const;
  [[nodiscard]] std::vector<model::Bottleneck> bottlenecks() const;
  [[nodiscard]] std::vector<model::ImplementedOptimization> optimization_history() const;
  [[nodiscard]] std::vector<model::BenchmarkResult> benchmark_history() const;
  [[nodiscard]] std::vector<model::Analysis> analysis_history() const;
  [[nodiscard]] std::vector<model::MetricSample> metrics_history() const;
  [[nodiscard]] bench::Baseline performance_baseline() const;
  [[nodiscard]] model::OptimizationReport generate_optimization_report() const;

  EventBus& events() noexcept { return events_; }
  [[nodiscard]] const AnalyzerConfig& config() const noexcept { return config_; }

 private:
  void start_timer();
  void stop_timer();
  void timer_loop();

  std::optional<model::Analysis> analyze(std::uint64_t now_ms);
  void commit(const model::Analysis& analysis);
  void prune_history(std::uint64_t now_ms);
  void publish_sinks(const model::Analysis& analysis);
  void auto_optimize(const std::vector<model::OptimizationRecommendation>& recommendations);
  // Caller holds work_mutex_; error receives the failure message when nullopt is returned.
  std::optional<model::ImplementedOptimization> run_optimization(
      const model::OptimizationRecommendation& recommendation, std::string& error);

  [[nodiscard]] std::optional<model::MetricSample> latest_sample() const;

  AnalyzerConfig config_;
  std::shared_ptr<Clock> clock_;
  analysis::Scorer scorer_;
  analysis::TrendAnalyzer trend_analyzer_{};
  analysis::BottleneckDetector bottleneck_detector_;
  analysis::RecommendationEngine recommendation_engine_{};
  bench::BenchmarkRunner benchmarks_;
  optimize::OptimizationExecutor executor_;
  persist::StateStore state_store_;
  EventBus events_{};

  sinks::StdoutDebugSink stdout_sink_{};
  std::unique_ptr<sinks::RedisTsSink> redis_sink_{};
  bool redis_was_ok_{true};

  // Guards every piece of state readable from other threads.
  mutable std::mutex state_mutex_;
  store::MetricsStore metrics_;
  BoundedHistory<model::Analysis> analysis_history_;
  BoundedHistory<model::BenchmarkResult> benchmark_history_;
  BoundedHistory<model::ImplementedOptimization> optimization_history_{kOptimizationHistoryCapacity};
  std::optional<model::Analysis> current_{};
  bench::Baseline baseline_{};

  // Serializes cycles, optimizations and baseline reloads; benchmarks_ is only touched under it.
  // Events are never emitted while it is held.
  std::mutex work_mutex_;
  std::atomic<bool> cycle_in_progress_{false};

  std::mutex timer_mutex_;
  std::condition_variable timer_cv_;
  bool stop_requested_{false};
  std::thread timer_thread_{};

  std::atomic<bool> initialized_{false};
  std::atomic<bool> shut_down_{false};
};

}  // namespace perf_analyzer::core
