#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "bench/benchmark_runner.hpp"
#include "model/analysis.hpp"
#include "model/report.hpp"

namespace perf_analyzer::persist {

// JSON files under the configured output directory. Every call logs its own failure and
// reports it through the return value; nothing here throws.
class StateStore {
 public:
  static constexpr const char* kBaselineFile = "performance-baseline.json";
  static constexpr const char* kAnalysisFile = "performance-analysis.json";

  explicit StateStore(std::filesystem::path output_dir);

  // nullopt when the file is missing or unreadable; non-numeric entries are skipped.
  [[nodiscard]] std::optional<bench::Baseline> load_baseline() const;
  bool save_baseline(const bench::Baseline& baseline) const;

  bool save_history(const std::vector<model::Analysis>& analyses,
                    const std::vector<model::ImplementedOptimization>& optimizations,
                    const bench::Baseline& baseline) const;

  // Writes optimization-report-<timestamp_ms>.json and returns its path.
  std::optional<std::filesystem::path> write_report(const model::OptimizationReport& report) const;

  [[nodiscard]] const std::filesystem::path& output_dir() const noexcept { return output_dir_; }

 private:
  bool write_json(const std::filesystem::path& path, const nlohmann::json& document) const;

  std::filesystem::path output_dir_;
};

}  // namespace perf_analyzer::persist
