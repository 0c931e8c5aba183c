#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "core/clock.hpp"
#include "model/analysis.hpp"

namespace perf_analyzer::bench {

// Benchmark name -> score of the run that seeded it.
using Baseline = std::map<std::string, double>;
using BenchmarkFn = std::function<model::BenchmarkResult(std::uint64_t now_ms)>;

// Fixed-reference workloads. Scores fall from 100 as duration/memory grow past the reference.
model::BenchmarkResult run_cpu_intensive(std::uint64_t now_ms);
model::BenchmarkResult run_memory_allocation(std::uint64_t now_ms);

model::comparison compare_lower_is_better(double value, double reference) noexcept;

// Resident set size of this process from /proc/self/statm; 0 when it cannot be read.
std::uint64_t resident_set_bytes() noexcept;

class BenchmarkRunner {
 public:
  explicit BenchmarkRunner(std::shared_ptr<core::Clock> clock);

  void register_benchmark(std::string name, BenchmarkFn run);
  void register_default_suite();

  // Runs every benchmark sequentially in registration order. A throwing benchmark is logged and skipped.
  std::vector<model::BenchmarkResult> run();

  // run() plus seeding the baseline for every benchmark name it does not know yet.
  std::vector<model::BenchmarkResult> run_initial();

  [[nodiscard]] const Baseline& baseline() const noexcept { return baseline_; }
  void set_baseline(Baseline baseline) { baseline_ = std::move(baseline); }

  [[nodiscard]] std::vector<std::string> names() const;

 private:
  struct Registration {
    std::string name;
    BenchmarkFn run;
  };

  void attach_baseline(model::BenchmarkResult& result) const;

  std::shared_ptr<core::Clock> clock_;
  std::vector<Registration> suite_{};
  Baseline baseline_{};
};

}  // namespace perf_analyzer::bench
