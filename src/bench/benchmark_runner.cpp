#include "bench/benchmark_runner.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <iostream>
#include <random>
#include <utility>

#include <unistd.h>

namespace perf_analyzer::bench {
namespace {

constexpr std::size_t kCpuIterations = 1'000'000;
constexpr double kCpuReferenceMs = 100.0;

constexpr std::size_t kAllocationCount = 1000;
constexpr std::size_t kAllocationLength = 1000;
constexpr double kMemoryReferenceMs = 50.0;
constexpr double kMemoryReferenceBytes = 16.0 * 1024.0 * 1024.0;

double elapsed_ms(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::duration<double, std::milli>>(std::chrono::steady_clock::now() - start)
      .count();
}

}  // namespace

model::comparison compare_lower_is_better(const double value, const double reference) noexcept {
  if (value < reference) {
    return model::comparison::BETTER;
  }
  if (value == reference) {
    return model::comparison::SAME;
  }
  return model::comparison::WORSE;
}

std::uint64_t resident_set_bytes() noexcept {
  std::FILE* statm = std::fopen("/proc/self/statm", "r");
  if (statm == nullptr) {
    return 0;
  }

  unsigned long long size_pages = 0;
  unsigned long long resident_pages = 0;
  const int fields = std::fscanf(statm, "%llu %llu", &size_pages, &resident_pages);
  std::fclose(statm);
  if (fields != 2) {
    return 0;
  }

  const long page_size = ::sysconf(_SC_PAGESIZE);
  if (page_size <= 0) {
    return 0;
  }
  return static_cast<std::uint64_t>(resident_pages) * static_cast<std::uint64_t>(page_size);
}

model::BenchmarkResult run_cpu_intensive(const std::uint64_t now_ms) {
  const auto start = std::chrono::steady_clock::now();

  double accumulator = 0.0;
  for (std::size_t i = 0; i < kCpuIterations; ++i) {
    accumulator += std::sqrt(static_cast<double>(i));
  }
  volatile double sink = accumulator;
  (void)sink;

  const double duration = elapsed_ms(start);

  model::BenchmarkResult result{};
  result.id = "cpu-benchmark";
  result.name = "cpu-intensive";
  result.title = "CPU Intensive Benchmark";
  result.timestamp_ms = now_ms;
  result.category = "system";
  result.metrics = {{"duration", duration}, {"operations", static_cast<double>(kCpuIterations)}};
  result.baseline = {{"duration", kCpuReferenceMs}, {"operations", static_cast<double>(kCpuIterations)}};
  result.comparisons = {{"duration", compare_lower_is_better(duration, kCpuReferenceMs)},
                        {"operations", model::comparison::SAME}};
  result.score = std::max(0.0, 100.0 - (duration / kCpuReferenceMs) * 100.0);
  return result;
}

model::BenchmarkResult run_memory_allocation(const std::uint64_t now_ms) {
  std::mt19937_64 rng{now_ms};
  std::uniform_real_distribution<double> fill(0.0, 1.0);

  const std::uint64_t resident_before = resident_set_bytes();
  const auto start = std::chrono::steady_clock::now();

  std::vector<std::vector<double>> arrays;
  arrays.reserve(kAllocationCount);
  for (std::size_t i = 0; i < kAllocationCount; ++i) {
    arrays.emplace_back(kAllocationLength, fill(rng));
  }

  const double duration = elapsed_ms(start);
  // Growth of the resident set while the arrays are live; pages the allocator already held do not count.
  const std::uint64_t resident_after = resident_set_bytes();
  const double bytes =
      resident_after > resident_before ? static_cast<double>(resident_after - resident_before) : 0.0;

  model::BenchmarkResult result{};
  result.id = "memory-benchmark";
  result.name = "memory-allocation";
  result.title = "Memory Allocation Benchmark";
  result.timestamp_ms = now_ms;
  result.category = "system";
  result.metrics = {{"duration", duration},
                    {"memoryUsage", bytes},
                    {"allocations", static_cast<double>(arrays.size())}};
  result.baseline = {{"duration", kMemoryReferenceMs},
                     {"memoryUsage", kMemoryReferenceBytes},
                     {"allocations", static_cast<double>(kAllocationCount)}};
  result.comparisons = {{"duration", compare_lower_is_better(duration, kMemoryReferenceMs)},
                        {"memoryUsage", compare_lower_is_better(bytes, kMemoryReferenceBytes)},
                        {"allocations", model::comparison::SAME}};
  result.score = std::max(
      0.0, 100.0 - (duration / kMemoryReferenceMs) * 50.0 - (bytes / kMemoryReferenceBytes) * 50.0);
  return result;
}

BenchmarkRunner::BenchmarkRunner(std::shared_ptr<core::Clock> clock) : clock_(std::move(clock)) {}

void BenchmarkRunner::register_benchmark(std::string name, BenchmarkFn run) {
  suite_.push_back({std::move(name), std::move(run)});
}

void BenchmarkRunner::register_default_suite() {
  register_benchmark("cpu-intensive", run_cpu_intensive);
  register_benchmark("memory-allocation", run_memory_allocation);
}

std::vector<model::BenchmarkResult> BenchmarkRunner::run() {
  std::vector<model::BenchmarkResult> results;
  results.reserve(suite_.size());

  for (const auto& benchmark : suite_) {
    try {
      model::BenchmarkResult result = benchmark.run(clock_->now_ms());
      result.name = benchmark.name;
      result.score = std::clamp(result.score, 0.0, 100.0);
      attach_baseline(result);
      results.push_back(std::move(result));
    } catch (const std::exception& ex) {
      std::cerr << "[bench] benchmark " << benchmark.name << " failed: " << ex.what() << '\n';
    }
  }

  return results;
}

std::vector<model::BenchmarkResult> BenchmarkRunner::run_initial() {
  auto results = run();

  double total = 0.0;
  for (const auto& result : results) {
    total += result.score;
    if (baseline_.find(result.name) == baseline_.end()) {
      baseline_[result.name] = result.score;
    }
  }

  std::cerr << "[bench] initial benchmarks completed | benchmarks=" << results.size()
            << " | average_score=" << (results.empty() ? 0.0 : total / static_cast<double>(results.size())) << '\n';
  return results;
}

std::vector<std::string> BenchmarkRunner::names() const {
  std::vector<std::string> out;
  out.reserve(suite_.size());
  for (const auto& benchmark : suite_) {
    out.push_back(benchmark.name);
  }
  return out;
}

void BenchmarkRunner::attach_baseline(model::BenchmarkResult& result) const {
  const auto it = baseline_.find(result.name);
  if (it == baseline_.end()) {
    return;
  }

  result.baseline_score = it->second;
  if (result.score > it->second) {
    result.comparisons["score"] = model::comparison::BETTER;
  } else if (result.score == it->second) {
    result.comparisons["score"] = model::comparison::SAME;
  } else {
    result.comparisons["score"] = model::comparison::WORSE;
  }
}

}  // namespace perf_analyzer::bench
