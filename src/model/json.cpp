#include "model/json.hpp"

#include <stdexcept>
#include <string>

namespace perf_analyzer::model {
namespace {

template <typename Enum>
nlohmann::json enum_map(const std::map<std::string, Enum>& values) {
  nlohmann::json out = nlohmann::json::object();
  for (const auto& [key, value] : values) {
    out[key] = to_string(value);
  }
  return out;
}

double number_or_zero(const nlohmann::json& j, const char* key) {
  const auto it = j.find(key);
  if (it == j.end() || !it->is_number()) {
    return 0.0;
  }
  return it->get<double>();
}

}  // namespace

void to_json(nlohmann::json& j, const MetricSample& sample) {
  j = nlohmann::json{
      {"timestamp", sample.timestamp_ms},
      {"system",
       {{"cpu", sample.system.cpu},
        {"memory", sample.system.memory},
        {"disk", sample.system.disk},
        {"network", sample.system.network_latency}}},
      {"application",
       {{"responseTime", sample.application.response_time},
        {"throughput", sample.application.throughput},
        {"errorRate", sample.application.error_rate},
        {"activeConnections", sample.application.active_connections}}},
      {"agents",
       {{"total", sample.agents.total},
        {"active", sample.agents.active},
        {"averageHealth", sample.agents.average_health}}},
  };
}

void from_json(const nlohmann::json& j, MetricSample& sample) {
  if (!j.is_object()) {
    throw std::invalid_argument("metric sample must be a JSON object");
  }

  sample = MetricSample{};
  const auto timestamp = j.find("timestamp");
  if (timestamp != j.end() && timestamp->is_number_unsigned()) {
    sample.timestamp_ms = timestamp->get<std::uint64_t>();
  }

  const nlohmann::json empty = nlohmann::json::object();
  const auto& system = j.contains("system") ? j.at("system") : empty;
  const auto& application = j.contains("application") ? j.at("application") : empty;
  const auto& agents = j.contains("agents") ? j.at("agents") : empty;

  sample.system.cpu = number_or_zero(system, "cpu");
  sample.system.memory = number_or_zero(system, "memory");
  sample.system.disk = number_or_zero(system, "disk");
  sample.system.network_latency = number_or_zero(system, "network");
  sample.application.response_time = number_or_zero(application, "responseTime");
  sample.application.throughput = number_or_zero(application, "throughput");
  sample.application.error_rate = number_or_zero(application, "errorRate");
  sample.application.active_connections = number_or_zero(application, "activeConnections");
  sample.agents.total = number_or_zero(agents, "total");
  sample.agents.active = number_or_zero(agents, "active");
  sample.agents.average_health = number_or_zero(agents, "averageHealth");
}

void to_json(nlohmann::json& j, const PerformanceIssue& issue) {
  j = nlohmann::json{
      {"id", issue.id},
      {"category", issue.category},
      {"severity", to_string(issue.severity)},
      {"title", issue.title},
      {"description", issue.description},
      {"impact", issue.impact},
      {"detectedAt", issue.detected_at_ms},
      {"frequency", issue.frequency},
      {"affectedMetrics", issue.affected_metrics},
      {"correlations", issue.correlations},
  };
}

void to_json(nlohmann::json& j, const MetricScore& metric) {
  j = nlohmann::json{{"name", metric.name}, {"path", metric.path}, {"value", metric.value}, {"score", metric.score}};
}

void to_json(nlohmann::json& j, const CategoryScore& category) {
  j = nlohmann::json{
      {"score", category.score},
      {"status", to_string(category.status)},
      {"metrics", category.metrics},
      {"trend", to_string(category.direction)},
      {"metricTrends", enum_map(category.metric_trends)},
      {"issues", category.issues},
  };
}

void to_json(nlohmann::json& j, const Bottleneck& bottleneck) {
  j = nlohmann::json{
      {"id", bottleneck.id},
      {"type", bottleneck.type},
      {"severity", to_string(bottleneck.severity)},
      {"description", bottleneck.description},
      {"impact", bottleneck.impact},
      {"location", bottleneck.location},
      {"detectingMetrics", bottleneck.detecting_metrics},
      {"recommendations", bottleneck.recommendations},
      {"estimatedCost", bottleneck.estimated_cost},
  };
}

void to_json(nlohmann::json& j, const OptimizationRecommendation& recommendation) {
  const auto& impact = recommendation.impact;
  const auto& effort = recommendation.effort;
  const auto& risk = recommendation.risk;
  const auto& implementation = recommendation.implementation;
  const auto& validation = recommendation.validation;

  j = nlohmann::json{
      {"id", recommendation.id},
      {"title", recommendation.title},
      {"description", recommendation.description},
      {"category", recommendation.category},
      {"priority", to_string(recommendation.rank)},
      {"impact",
       {{"performance", impact.performance},
        {"cost", impact.cost},
        {"reliability", impact.reliability},
        {"maintainability", impact.maintainability}}},
      {"effort",
       {{"implementation", to_string(effort.implementation)},
        {"testing", to_string(effort.testing)},
        {"maintenance", to_string(effort.maintenance)}}},
      {"risk", {{"level", to_string(risk.risk_level)}, {"factors", risk.factors}, {"mitigation", risk.mitigation}}},
      {"implementation",
       {{"steps", implementation.steps},
        {"timeline", implementation.timeline},
        {"resources", implementation.resources},
        {"dependencies", implementation.dependencies}}},
      {"validation",
       {{"metrics", validation.metrics}, {"tests", validation.tests}, {"criteria", validation.criteria}}},
      {"alternatives", recommendation.alternatives},
      {"references", recommendation.references},
  };
}

void to_json(nlohmann::json& j, const BenchmarkResult& result) {
  j = nlohmann::json{
      {"id", result.id},
      {"name", result.name},
      {"title", result.title},
      {"timestamp", result.timestamp_ms},
      {"category", result.category},
      {"metrics", result.metrics},
      {"baseline", result.baseline},
      {"comparison", enum_map(result.comparisons)},
      {"score", result.score},
  };
  if (result.baseline_score.has_value()) {
    j["baselineScore"] = *result.baseline_score;
  }
}

void to_json(nlohmann::json& j, const ImplementedOptimization& optimization) {
  j = nlohmann::json{
      {"id", optimization.id},
      {"name", optimization.name},
      {"implementedAt", optimization.implemented_at_ms},
      {"category", optimization.category},
      {"beforeMetrics", optimization.before},
      {"afterMetrics", optimization.after},
      {"improvement", optimization.improvement},
      {"cost", optimization.cost},
      {"effort", to_string(optimization.effort)},
      {"status", to_string(optimization.status)},
      {"notes", optimization.notes},
  };
}

void to_json(nlohmann::json& j, const TrendSummary& trends) {
  j = nlohmann::json{{"overall", to_string(trends.overall)}, {"categories", enum_map(trends.categories)}};
}

void to_json(nlohmann::json& j, const Analysis& analysis) {
  j = nlohmann::json{
      {"timestamp", analysis.timestamp_ms},
      {"period", analysis.period},
      {"overallScore", analysis.overall_score},
      {"categories", analysis.categories},
      {"bottlenecks", analysis.bottlenecks},
      {"recommendations", analysis.recommendations},
      {"trends", analysis.trends},
      {"benchmarks", analysis.benchmarks},
  };
  if (analysis.final_report) {
    j["finalReport"] = true;
  }
}

void to_json(nlohmann::json& j, const PlannedOptimization& planned) {
  j = nlohmann::json{
      {"id", planned.id},
      {"name", planned.name},
      {"category", planned.category},
      {"expectedImpact", planned.expected_impact},
      {"estimatedCost", planned.estimated_cost},
      {"estimatedEffort", to_string(planned.estimated_effort)},
      {"priority", to_string(planned.rank)},
      {"dependencies", planned.dependencies},
      {"risks", planned.risks},
  };
}

void to_json(nlohmann::json& j, const TargetProgress& target) {
  j = nlohmann::json{
      {"id", target.id},
      {"metric", target.metric},
      {"targetValue", target.target_value},
      {"currentValue", target.current_value},
      {"met", target.met},
  };
}

void to_json(nlohmann::json& j, const Roi& roi) {
  j = nlohmann::json{
      {"totalInvestment", roi.total_investment},
      {"totalSavings", roi.total_savings},
      {"paybackPeriod", roi.payback_period},
      {"roi", roi.roi},
  };
}

void to_json(nlohmann::json& j, const OptimizationReport& report) {
  j = nlohmann::json{
      {"timestamp", report.timestamp_ms},
      {"analysis", nullptr},
      {"implementedOptimizations", report.implemented},
      {"plannedOptimizations", report.planned},
      {"targets", report.targets},
      {"roi", report.roi},
      {"nextSteps", report.next_steps},
  };
  if (report.analysis.has_value()) {
    j["analysis"] = *report.analysis;
  }
}

}  // namespace perf_analyzer::model
