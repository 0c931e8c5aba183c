#include "core/analyzer.hpp"

#include <atomic>
#include <exception>
#include <iostream>
#include <utility>

#include "report/report_builder.hpp"

namespace perf_analyzer::core {
namespace {

std::size_t history_capacity(const AnalyzerConfig& config) {
  const auto interval_ms = config.analysis_interval.count() > 0 ? config.analysis_interval.count() : 1;
  return static_cast<std::size_t>(config.retention_period.count() / interval_ms) + 1;
}

std::uint64_t cutoff_for(const std::uint64_t now_ms, const std::chrono::milliseconds age) {
  const auto age_ms = static_cast<std::uint64_t>(age.count());
  return now_ms > age_ms ? now_ms - age_ms : 0;
}

std::string format_period(const std::chrono::milliseconds window) {
  constexpr long long kHourMs = 60LL * 60 * 1000;
  constexpr long long kMinuteMs = 60LL * 1000;
  const long long ms = window.count();
  if (ms > 0 && ms % kHourMs == 0) {
    return std::to_string(ms / kHourMs) + "h";
  }
  if (ms > 0 && ms % kMinuteMs == 0) {
    return std::to_string(ms / kMinuteMs) + "m";
  }
  return std::to_string(ms / 1000) + "s";
}

std::shared_ptr<optimize::StepExecutor> default_steps(std::shared_ptr<optimize::StepExecutor> steps,
                                                      const bool debug_logging) {
  if (steps != nullptr) {
    return steps;
  }
  return std::make_shared<optimize::StepRegistry>(debug_logging);
}

// Clears the in-progress flag however the cycle ends.
class CycleGuard {
 public:
  explicit CycleGuard(std::atomic<bool>& flag) : flag_(flag) {}
  ~CycleGuard() { flag_ = false; }

  CycleGuard(const CycleGuard&) = delete;
  CycleGuard& operator=(const CycleGuard&) = delete;

 private:
  std::atomic<bool>& flag_;
};

void log_redis_target(const char* outcome, const RedisConfig& redis) {
  if (!redis.unix_socket.empty()) {
    std::cerr << "[redis] connectivity " << outcome << " at unix://" << redis.unix_socket << '\n';
  } else {
    std::cerr << "[redis] connectivity " << outcome << " at " << redis.host << ':' << redis.port << '\n';
  }
}

}  // namespace

Analyzer::Analyzer(AnalyzerConfig config, std::shared_ptr<Clock> clock, std::shared_ptr<optimize::StepExecutor> steps)
    : config_(std::move(config)),
      clock_(clock != nullptr ? std::move(clock) : make_system_clock()),
      scorer_(config_.thresholds),
      bottleneck_detector_(config_.thresholds),
      benchmarks_(clock_),
      executor_(default_steps(std::move(steps), config_.debug_logging), clock_, config_.stabilization_delay,
                config_.debug_logging),
      state_store_(config_.output_dir),
      metrics_(config_.retention_period, config_.sample_interval),
      analysis_history_(history_capacity(config_)),
      benchmark_history_(history_capacity(config_) * kBenchmarksPerCycle) {
  benchmarks_.register_default_suite();

  if (config_.redis.enabled) {
    sinks::RedisTsOptions options{};
    options.host = config_.redis.host;
    options.port = config_.redis.port;
    options.unix_socket = config_.redis.unix_socket;
    options.key_prefix = config_.redis.key_prefix;
    options.password = config_.redis.password;
    options.db = config_.redis.db;
    redis_sink_ = std::make_unique<sinks::RedisTsSink>(options);
    log_redis_target(redis_sink_->check_connectivity() ? "confirmed" : "check failed", config_.redis);
  }
}

Analyzer::~Analyzer() { stop_timer(); }

void Analyzer::initialize() {
  if (initialized_.exchange(true)) {
    return;
  }

  reload_baseline();

  if (config_.benchmark_enabled) {
    std::lock_guard<std::mutex> work(work_mutex_);
    try {
      const auto results = benchmarks_.run_initial();
      std::lock_guard<std::mutex> lock(state_mutex_);
      for (const auto& result : results) {
        benchmark_history_.push(result);
      }
      baseline_ = benchmarks_.baseline();
    } catch (const std::exception& ex) {
      std::cerr << "[analyzer] initial benchmarks failed: " << ex.what() << '\n';
    }
  }

  start_timer();
  std::cerr << "[analyzer] initialized | analysis_interval_ms=" << config_.analysis_interval.count()
            << " | retention_period_ms=" << config_.retention_period.count()
            << " | auto_optimization=" << (config_.auto_optimization ? "true" : "false")
            << " | benchmark_enabled=" << (config_.benchmark_enabled ? "true" : "false") << '\n';
  events_.emit_initialized();
}

void Analyzer::add_metrics(const model::MetricSample& sample) noexcept {
  const std::uint64_t now_ms = clock_->now_ms();
  std::lock_guard<std::mutex> lock(state_mutex_);
  metrics_.add(sample, now_ms);
}

bool Analyzer::run_cycle() {
  if (cycle_in_progress_.exchange(true)) {
    if (config_.debug_logging) {
      std::cerr << "[analyzer] cycle skipped; previous cycle still running\n";
    }
    return false;
  }

  CycleGuard guard(cycle_in_progress_);
  const auto started = std::chrono::steady_clock::now();

  // Subscribers run after the work lock is released so they may call back into the engine.
  std::optional<model::Analysis> analysis;
  std::optional<std::string> failure;
  {
    std::lock_guard<std::mutex> work(work_mutex_);
    try {
      analysis = analyze(clock_->now_ms());
    } catch (const std::exception& ex) {
      failure = ex.what();
    }
    if (analysis.has_value()) {
      commit(*analysis);
      publish_sinks(*analysis);
    }
  }

  if (failure.has_value()) {
    std::cerr << "[analyzer] analysis cycle failed: " << *failure << '\n';
    events_.emit_analysis_failed(*failure);
    return false;
  }

  if (!analysis.has_value()) {
    return false;
  }

  events_.emit_analysis_completed(*analysis);

  if (config_.debug_logging) {
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(std::chrono::steady_clock::now() - started);
    std::cerr << "[analyzer] cycle completed | overall_score=" << analysis->overall_score
              << " | bottlenecks=" << analysis->bottlenecks.size()
              << " | recommendations=" << analysis->recommendations.size() << " | elapsed_ms=" << elapsed.count()
              << '\n';
  }

  if (config_.auto_optimization) {
    auto_optimize(analysis->recommendations);
  }

  return true;
}

std::optional<model::Analysis> Analyzer::analyze(const std::uint64_t now_ms) {
  std::vector<model::MetricSample> window;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    window = metrics_.recent(now_ms, config_.analysis_window);
  }

  if (window.empty()) {
    if (config_.debug_logging) {
      std::cerr << "[analyzer] cycle skipped; no samples in the analysis window\n";
    }
    return std::nullopt;
  }

  model::Analysis result{};
  result.timestamp_ms = now_ms;
  result.period = format_period(config_.analysis_window);
  result.categories = scorer_.score_categories(window, now_ms);
  result.trends = trend_analyzer_.analyze(window, result.categories);
  result.overall_score = analysis::overall_score(result.categories);
  result.bottlenecks = bottleneck_detector_.detect(window.back());
  result.recommendations = recommendation_engine_.generate(result.categories, result.bottlenecks);

  if (config_.benchmark_enabled) {
    result.benchmarks = benchmarks_.run();
  }

  return result;
}

void Analyzer::commit(const model::Analysis& analysis) {
  std::lock_guard<std::mutex> lock(state_mutex_);
  current_ = analysis;
  analysis_history_.push(analysis);
  for (const auto& result : analysis.benchmarks) {
    benchmark_history_.push(result);
  }
  baseline_ = benchmarks_.baseline();
  prune_history(analysis.timestamp_ms);
}

void Analyzer::prune_history(const std::uint64_t now_ms) {
  const std::uint64_t cutoff = cutoff_for(now_ms, config_.retention_period);
  const auto analyses = analysis_history_.prune_if(
      [cutoff](const model::Analysis& analysis) { return analysis.timestamp_ms < cutoff; });
  const auto benchmarks = benchmark_history_.prune_if(
      [cutoff](const model::BenchmarkResult& result) { return result.timestamp_ms < cutoff; });
  const auto samples = metrics_.prune(now_ms);

  if (config_.debug_logging && (analyses + benchmarks + samples) > 0) {
    std::cerr << "[analyzer] retention pruned | analyses=" << analyses << " | benchmarks=" << benchmarks
              << " | samples=" << samples << '\n';
  }
}

void Analyzer::publish_sinks(const model::Analysis& analysis) {
  if (config_.stdout_debug) {
    stdout_sink_.publish(analysis);
  }

  if (redis_sink_ == nullptr) {
    return;
  }

  const bool ok = redis_sink_->publish(analysis);
  if (!ok && redis_was_ok_) {
    std::cerr << "[redis] publish failed\n";
    redis_was_ok_ = false;
  } else if (ok && !redis_was_ok_) {
    std::cerr << "[redis] publish recovered\n";
    redis_was_ok_ = true;
  }
}

void Analyzer::auto_optimize(const std::vector<model::OptimizationRecommendation>& recommendations) {
  for (const auto& recommendation : recommendations) {
    if (!analysis::auto_executable(recommendation)) {
      continue;
    }
    execute_optimization(recommendation);
  }
}

std::optional<model::ImplementedOptimization> Analyzer::execute_optimization(
    const model::OptimizationRecommendation& recommendation) {
  std::optional<model::ImplementedOptimization> result;
  std::string error;
  {
    std::lock_guard<std::mutex> work(work_mutex_);
    result = run_optimization(recommendation, error);
  }

  if (result.has_value()) {
    events_.emit_optimization_completed(*result);
  } else {
    events_.emit_optimization_failed(recommendation, error);
  }
  return result;
}

std::optional<model::ImplementedOptimization> Analyzer::run_optimization(
    const model::OptimizationRecommendation& recommendation, std::string& error) {
  try {
    auto result = executor_.execute(recommendation, [this] { return optimize::capture_metrics(latest_sample()); });
    std::lock_guard<std::mutex> lock(state_mutex_);
    optimization_history_.push(result);
    return result;
  } catch (const std::exception& ex) {
    std::cerr << "[optimize] " << recommendation.id << " failed: " << ex.what() << '\n';
    error = ex.what();
    return std::nullopt;
  }
}

bool Analyzer::reload_baseline() {
  std::lock_guard<std::mutex> work(work_mutex_);
  auto loaded = state_store_.load_baseline();
  if (!loaded.has_value()) {
    return false;
  }

  benchmarks_.set_baseline(*loaded);
  std::lock_guard<std::mutex> lock(state_mutex_);
  baseline_ = std::move(*loaded);
  return true;
}

void Analyzer::register_benchmark(std::string name, bench::BenchmarkFn run) {
  std::lock_guard<std::mutex> work(work_mutex_);
  benchmarks_.register_benchmark(std::move(name), std::move(run));
}

bool Analyzer::register_bottleneck_rule(analysis::BottleneckRule rule) {
  std::lock_guard<std::mutex> work(work_mutex_);
  try {
    bottleneck_detector_.add_rule(std::move(rule));
    return true;
  } catch (const std::exception& ex) {
    std::cerr << "[analyzer] bottleneck rule rejected: " << ex.what() << '\n';
    return false;
  }
}

void Analyzer::shutdown() {
  if (shut_down_.exchange(true)) {
    return;
  }

  std::cerr << "[analyzer] shutting down\n";
  stop_timer();

  std::optional<model::Analysis> last;
  {
    // Waits for a cycle or optimization started from another thread.
    std::lock_guard<std::mutex> work(work_mutex_);

    std::vector<model::Analysis> analyses;
    std::vector<model::ImplementedOptimization> optimizations;
    bench::Baseline baseline;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      analyses = analysis_history_.snapshot();
      optimizations = optimization_history_.snapshot();
      baseline = baseline_;
      last = current_;
    }

    state_store_.save_history(analyses, optimizations, baseline);
    if (!baseline.empty()) {
      state_store_.save_baseline(baseline);
    }

    if (config_.reporting_enabled) {
      state_store_.write_report(generate_optimization_report());
    }
  }

  if (last.has_value()) {
    last->final_report = true;
    events_.emit_analysis_completed(*last);
  }

  events_.emit_shutdown();
  std::cerr << "[analyzer] shutdown complete\n";
}

void Analyzer::start_timer() {
  std::lock_guard<std::mutex> lock(timer_mutex_);
  if (timer_thread_.joinable()) {
    return;
  }
  stop_requested_ = false;
  timer_thread_ = std::thread(&Analyzer::timer_loop, this);
}

void Analyzer::stop_timer() {
  {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    stop_requested_ = true;
  }
  timer_cv_.notify_all();
  // A subscriber running on the timer thread cannot join it; the loop exits once its cycle returns.
  if (timer_thread_.joinable() && timer_thread_.get_id() != std::this_thread::get_id()) {
    timer_thread_.join();
  }
}

void Analyzer::timer_loop() {
  const auto interval = config_.analysis_interval;
  auto next_tick = std::chrono::steady_clock::now() + interval;

  std::unique_lock<std::mutex> lock(timer_mutex_);
  while (!stop_requested_) {
    if (timer_cv_.wait_until(lock, next_tick, [this] { return stop_requested_; })) {
      break;
    }

    lock.unlock();
    run_cycle();
    lock.lock();

    next_tick += interval;
    const auto now = std::chrono::steady_clock::now();
    std::size_t missed = 0;
    while (next_tick <= now) {
      next_tick += interval;
      ++missed;
    }
    if (missed > 0 && config_.debug_logging) {
      std::cerr << "[analyzer] skipped " << missed << " tick(s) while a cycle was running\n";
    }
  }
}

std::optional<model::MetricSample> Analyzer::latest_sample() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return metrics_.latest();
}

std::optional<model::Analysis> Analyzer::current_analysis() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return current_;
}

std::vector<model::OptimizationRecommendation> Analyzer::optimization_recommendations() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return current_.has_value() ? current_->recommendations : std::vector<model::OptimizationRecommendation>{};
}

std::vector<model::Bottleneck> Analyzer::bottlenecks() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return current_.has_value() ? current_->bottlenecks : std::vector<model::Bottleneck>{};
}

std::vector<model::ImplementedOptimization> Analyzer::optimization_history() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return optimization_history_.snapshot();
}

std::vector<model::BenchmarkResult> Analyzer::benchmark_history() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return benchmark_history_.snapshot();
}

std::vector<model::Analysis> Analyzer::analysis_history() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return analysis_history_.snapshot();
}

std::vector<model::MetricSample> Analyzer::metrics_history() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return metrics_.recent(clock_->now_ms(), config_.retention_period);
}

bench::Baseline Analyzer::performance_baseline() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return baseline_;
}

model::OptimizationReport Analyzer::generate_optimization_report() const {
  report::ReportInputs inputs{};
  inputs.timestamp_ms = clock_->now_ms();
  inputs.targets = config_.optimization_targets;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    inputs.analysis = current_;
    inputs.latest = metrics_.latest();
    inputs.history = optimization_history_.snapshot();
  }

  try {
    return report::build_report(inputs);
  } catch (const std::exception& ex) {
    std::cerr << "[analyzer] failed to build optimization report: " << ex.what() << '\n';
    model::OptimizationReport fallback{};
    fallback.timestamp_ms = inputs.timestamp_ms;
    fallback.next_steps = {"Continue monitoring and analysis"};
    return fallback;
  }
}

}  // namespace perf_analyzer::core
