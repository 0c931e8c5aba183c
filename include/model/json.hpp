#pragma once

#include <nlohmann/json.hpp>

#include "model/analysis.hpp"
#include "model/metric_sample.hpp"
#include "model/report.hpp"

namespace perf_analyzer::model {

// Field names follow the persisted files and the NDJSON ingest format (camelCase).
void to_json(nlohmann::json& j, const MetricSample& sample);
// Missing fields read as 0 so partial samples from a collector are still accepted.
void from_json(const nlohmann::json& j, MetricSample& sample);

void to_json(nlohmann::json& j, const PerformanceIssue& issue);
void to_json(nlohmann::json& j, const MetricScore& metric);
void to_json(nlohmann::json& j, const CategoryScore& category);
void to_json(nlohmann::json& j, const Bottleneck& bottleneck);
void to_json(nlohmann::json& j, const OptimizationRecommendation& recommendation);
void to_json(nlohmann::json& j, const BenchmarkResult& result);
void to_json(nlohmann::json& j, const ImplementedOptimization& optimization);
void to_json(nlohmann::json& j, const TrendSummary& trends);
void to_json(nlohmann::json& j, const Analysis& analysis);

void to_json(nlohmann::json& j, const PlannedOptimization& planned);
void to_json(nlohmann::json& j, const TargetProgress& target);
void to_json(nlohmann::json& j, const Roi& roi);
void to_json(nlohmann::json& j, const OptimizationReport& report);

}  // namespace perf_analyzer::model
