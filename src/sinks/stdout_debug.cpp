#include "sinks/stdout_debug.hpp"

#include <cstdio>

namespace perf_analyzer::sinks {
namespace {

double category_score(const model::Analysis& analysis, const char* name) {
  const auto it = analysis.categories.find(name);
  return it != analysis.categories.end() ? it->second.score : 0.0;
}

}  // namespace

void StdoutDebugSink::publish(const model::Analysis& analysis) const {
  std::printf(
      "[analysis] ts=%llu overall=%.2f system=%.2f application=%.2f resources=%.2f network=%.2f agents=%.2f "
      "trend=%s bottlenecks=%zu recommendations=%zu\n",
      static_cast<unsigned long long>(analysis.timestamp_ms), analysis.overall_score,
      category_score(analysis, "system"), category_score(analysis, "application"),
      category_score(analysis, "resources"), category_score(analysis, "network"), category_score(analysis, "agents"),
      model::to_string(analysis.trends.overall), analysis.bottlenecks.size(), analysis.recommendations.size());
  std::fflush(stdout);
}

}  // namespace perf_analyzer::sinks
