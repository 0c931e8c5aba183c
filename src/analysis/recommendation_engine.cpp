#include "analysis/recommendation_engine.hpp"

#include <unordered_set>

namespace perf_analyzer::analysis {
namespace {

bool below_floor(const std::map<std::string, model::CategoryScore>& categories, const std::string& name) {
  const auto it = categories.find(name);
  return it != categories.end() && it->second.score < RecommendationEngine::kCategoryScoreFloor;
}

}  // namespace

std::vector<model::OptimizationRecommendation> RecommendationEngine::generate(
    const std::map<std::string, model::CategoryScore>& categories,
    const std::vector<model::Bottleneck>& bottlenecks) const {
  std::vector<model::OptimizationRecommendation> recommendations;

  if (below_floor(categories, "system")) {
    recommendations.push_back(system_optimization());
  }

  if (below_floor(categories, "application")) {
    recommendations.push_back(application_optimization());
  }

  std::unordered_set<std::string> seen;
  for (const auto& bottleneck : bottlenecks) {
    if (!seen.insert(bottleneck.id).second) {
      continue;
    }
    recommendations.push_back(for_bottleneck(bottleneck));
  }

  return recommendations;
}

model::OptimizationRecommendation RecommendationEngine::system_optimization() {
  model::OptimizationRecommendation rec{};
  rec.id = "system-optimization";
  rec.title = "System Resource Optimization";
  rec.description = "Optimize system resource utilization to improve overall performance";
  rec.category = "resource";
  rec.rank = model::priority::HIGH;
  rec.impact = {25.0, -10.0, 20.0, 15.0};
  rec.effort = {model::level::MEDIUM, model::level::MEDIUM, model::level::LOW};
  rec.risk.risk_level = model::level::LOW;
  rec.risk.factors = {"Temporary performance impact during optimization"};
  rec.risk.mitigation = {"Perform during maintenance window", "Gradual rollout"};
  rec.implementation.steps = {
      "Analyze current resource usage patterns",
      "Identify optimization opportunities",
      "Implement resource-efficient algorithms",
      "Monitor and validate improvements",
  };
  rec.implementation.timeline = "2-3 weeks";
  rec.implementation.resources = {"DevOps Engineer", "Performance Analyst"};
  rec.implementation.dependencies = {"Monitoring system", "Test environment"};
  rec.validation.metrics = {"system.cpu", "system.memory"};
  rec.validation.tests = {"Load testing", "Stress testing"};
  rec.validation.criteria = {"CPU usage < 70%", "Memory usage < 80%"};
  rec.alternatives = {"Horizontal scaling", "Infrastructure upgrade"};
  rec.references = {"Performance Best Practices", "Resource Optimization Guide"};
  return rec;
}

model::OptimizationRecommendation RecommendationEngine::application_optimization() {
  model::OptimizationRecommendation rec{};
  rec.id = "application-optimization";
  rec.title = "Application Performance Optimization";
  rec.description = "Optimize application performance through caching and algorithm improvements";
  rec.category = "performance";
  rec.rank = model::priority::HIGH;
  rec.impact = {30.0, -5.0, 25.0, 10.0};
  rec.effort = {model::level::HIGH, model::level::HIGH, model::level::MEDIUM};
  rec.risk.risk_level = model::level::MEDIUM;
  rec.risk.factors = {"Code changes may introduce bugs", "Performance regression risk"};
  rec.risk.mitigation = {"Comprehensive testing", "Feature flags", "Gradual rollout"};
  rec.implementation.steps = {
      "Profile application performance",
      "Identify performance bottlenecks",
      "Implement caching strategies",
      "Optimize critical code paths",
      "Validate performance improvements",
  };
  rec.implementation.timeline = "4-6 weeks";
  rec.implementation.resources = {"Senior Developer", "Performance Engineer"};
  rec.implementation.dependencies = {"Code profiling tools", "Test data"};
  rec.validation.metrics = {"application.responseTime", "application.throughput"};
  rec.validation.tests = {"Performance regression tests", "Load testing"};
  rec.validation.criteria = {"Response time < 500ms", "Throughput > 1000 req/s"};
  rec.alternatives = {"Infrastructure scaling", "CDN implementation"};
  rec.references = {"Application Performance Guide", "Caching Best Practices"};
  return rec;
}

model::OptimizationRecommendation RecommendationEngine::for_bottleneck(const model::Bottleneck& bottleneck) {
  model::OptimizationRecommendation rec{};
  rec.id = "fix-" + bottleneck.id;
  rec.title = "Fix " + bottleneck.type + " Bottleneck";
  rec.description = bottleneck.description;
  rec.category = "performance";
  rec.rank = bottleneck.severity;
  rec.impact = {bottleneck.impact, -bottleneck.estimated_cost / 1000.0, 20.0, 10.0};
  rec.effort = {model::level::MEDIUM, model::level::MEDIUM, model::level::LOW};
  rec.risk.risk_level = model::level::LOW;
  rec.risk.factors = {"Performance changes may affect other components"};
  rec.risk.mitigation = {"Gradual rollout", "Monitoring", "Rollback plan"};
  rec.implementation.steps = bottleneck.recommendations;
  rec.implementation.timeline = "1-2 weeks";
  rec.implementation.resources = {"DevOps Engineer"};
  rec.implementation.dependencies = {"Monitoring tools"};
  rec.validation.metrics = bottleneck.detecting_metrics;
  rec.validation.tests = {"Performance testing"};
  rec.validation.criteria = {"Improved performance metrics"};
  rec.alternatives = {"Infrastructure upgrade"};
  rec.references = {"Performance Optimization Guide"};
  return rec;
}

bool auto_executable(const model::OptimizationRecommendation& recommendation) noexcept {
  return recommendation.rank == model::priority::HIGH && recommendation.risk.risk_level == model::level::LOW;
}

}  // namespace perf_analyzer::analysis
