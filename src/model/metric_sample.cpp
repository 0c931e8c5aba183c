#include "model/metric_sample.hpp"

namespace perf_analyzer::model {

double metric_value(const MetricSample& sample, const std::string_view path) noexcept {
  if (path == "system.cpu") {
    return sample.system.cpu;
  }
  if (path == "system.memory") {
    return sample.system.memory;
  }
  if (path == "system.disk") {
    return sample.system.disk;
  }
  if (path == "system.network") {
    return sample.system.network_latency;
  }
  if (path == "application.responseTime") {
    return sample.application.response_time;
  }
  if (path == "application.throughput") {
    return sample.application.throughput;
  }
  if (path == "application.errorRate") {
    return sample.application.error_rate;
  }
  if (path == "application.activeConnections") {
    return sample.application.active_connections;
  }
  if (path == "agents.total") {
    return sample.agents.total;
  }
  if (path == "agents.active") {
    return sample.agents.active;
  }
  if (path == "agents.averageHealth") {
    return sample.agents.average_health;
  }
  return 0.0;
}

}  // namespace perf_analyzer::model
