#include "persist/state_store.hpp"

#include <exception>
#include <fstream>
#include <iostream>
#include <system_error>
#include <utility>

#include "model/json.hpp"

namespace perf_analyzer::persist {

StateStore::StateStore(std::filesystem::path output_dir) : output_dir_(std::move(output_dir)) {}

std::optional<bench::Baseline> StateStore::load_baseline() const {
  const auto path = output_dir_ / kBaselineFile;
  std::ifstream input(path);
  if (!input.is_open()) {
    std::cerr << "[persist] no performance baseline at " << path.string() << "; a new one will be seeded\n";
    return std::nullopt;
  }

  try {
    const auto document = nlohmann::json::parse(input);
    if (!document.is_object()) {
      std::cerr << "[persist] ignoring baseline " << path.string() << ": not a JSON object\n";
      return std::nullopt;
    }

    bench::Baseline baseline;
    for (const auto& [name, value] : document.items()) {
      if (value.is_number()) {
        baseline[name] = value.get<double>();
      }
    }
    std::cerr << "[persist] performance baseline loaded (" << baseline.size() << " benchmarks)\n";
    return baseline;
  } catch (const std::exception& ex) {
    std::cerr << "[persist] failed to parse baseline " << path.string() << ": " << ex.what() << '\n';
    return std::nullopt;
  }
}

bool StateStore::save_baseline(const bench::Baseline& baseline) const {
  return write_json(output_dir_ / kBaselineFile, nlohmann::json(baseline));
}

bool StateStore::save_history(const std::vector<model::Analysis>& analyses,
                              const std::vector<model::ImplementedOptimization>& optimizations,
                              const bench::Baseline& baseline) const {
  try {
    const nlohmann::json document{
        {"analysisHistory", analyses},
        {"optimizationHistory", optimizations},
        {"performanceBaseline", baseline},
    };
    if (!write_json(output_dir_ / kAnalysisFile, document)) {
      return false;
    }
  } catch (const std::exception& ex) {
    std::cerr << "[persist] failed to serialize analysis history: " << ex.what() << '\n';
    return false;
  }

  std::cerr << "[persist] analysis results saved (" << analyses.size() << " analyses, " << optimizations.size()
            << " optimizations)\n";
  return true;
}

std::optional<std::filesystem::path> StateStore::write_report(const model::OptimizationReport& report) const {
  const auto path = output_dir_ / ("optimization-report-" + std::to_string(report.timestamp_ms) + ".json");
  try {
    if (!write_json(path, nlohmann::json(report))) {
      return std::nullopt;
    }
  } catch (const std::exception& ex) {
    std::cerr << "[persist] failed to serialize optimization report: " << ex.what() << '\n';
    return std::nullopt;
  }

  std::cerr << "[persist] final optimization report written to " << path.string() << '\n';
  return path;
}

bool StateStore::write_json(const std::filesystem::path& path, const nlohmann::json& document) const {
  std::error_code ec;
  std::filesystem::create_directories(output_dir_, ec);
  if (ec) {
    std::cerr << "[persist] unable to create " << output_dir_.string() << ": " << ec.message() << '\n';
    return false;
  }

  std::ofstream output(path, std::ios::trunc);
  if (!output.is_open()) {
    std::cerr << "[persist] unable to open " << path.string() << " for writing\n";
    return false;
  }

  try {
    output << document.dump(2) << '\n';
  } catch (const std::exception& ex) {
    std::cerr << "[persist] failed to encode " << path.string() << ": " << ex.what() << '\n';
    return false;
  }
  output.flush();
  if (!output) {
    std::cerr << "[persist] write failed for " << path.string() << '\n';
    return false;
  }
  return true;
}

}  // namespace perf_analyzer::persist
