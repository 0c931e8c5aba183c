#pragma once

#include <cstdint>
#include <string_view>
#include <type_traits>

namespace perf_analyzer::model {

// One collector observation. POD layout so samples can be copied in bulk out of the store.
struct MetricSample {
  struct System {
    double cpu;              // percent
    double memory;           // percent
    double disk;             // percent
    double network_latency;  // ms
  };

  struct Application {
    double response_time;  // ms
    double throughput;     // ops/min
    double error_rate;     // percent
    double active_connections;
  };

  struct Agents {
    double total;
    double active;
    double average_health;  // 0..1
  };

  std::uint64_t timestamp_ms;

  System system;
  Application application;
  Agents agents;
};

static_assert(std::is_standard_layout_v<MetricSample>, "MetricSample must be standard layout");
static_assert(std::is_trivial_v<MetricSample>, "MetricSample must be trivial");

// Dotted metric paths ("system.cpu", "application.responseTime", ...). Unknown paths read as 0.
double metric_value(const MetricSample& sample, std::string_view path) noexcept;

}  // namespace perf_analyzer::model
