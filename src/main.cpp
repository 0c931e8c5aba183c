#include <csignal>
#include <cstddef>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>

#include <poll.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "core/analyzer.hpp"
#include "core/config.hpp"
#include "core/timestamp.hpp"
#include "model/json.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

constexpr int kStdinPollMs = 250;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

std::string format_config_settings(const perf_analyzer::core::AnalyzerConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[config] loaded config from " << config_path
         << " | analysis_interval_ms=" << config.analysis_interval.count()
         << " | retention_period_ms=" << config.retention_period.count()
         << " | analysis_window_ms=" << config.analysis_window.count()
         << " | auto_optimization=" << (config.auto_optimization ? "true" : "false")
         << " | benchmark_enabled=" << (config.benchmark_enabled ? "true" : "false")
         << " | reporting_enabled=" << (config.reporting_enabled ? "true" : "false")
         << " | targets=" << config.optimization_targets.size()
         << " | output_dir=" << config.output_dir
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false");

  if (config.redis.enabled) {
    output << " | redis_address=";
    if (!config.redis.unix_socket.empty()) {
      output << "unix://" << config.redis.unix_socket;
    } else {
      output << config.redis.host << ':' << config.redis.port;
    }
  }
  return output.str();
}

// Waits for stdin without blocking signal-driven shutdown forever. -1 on error.
int wait_for_input() {
  if (std::cin.rdbuf()->in_avail() > 0) {
    return 1;
  }

  pollfd fd{};
  fd.fd = STDIN_FILENO;
  fd.events = POLLIN;
  return ::poll(&fd, 1, kStdinPollMs);
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);
  std::ios::sync_with_stdio(false);

  const std::string config_path = argc > 1 ? argv[1] : "configs/analyzer.example.yaml";

  perf_analyzer::core::AnalyzerConfig config{};
  try {
    config = perf_analyzer::core::load_analyzer_config(config_path);
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  std::cerr << format_config_settings(config, config_path) << '\n';

  perf_analyzer::core::Analyzer analyzer{config};
  analyzer.initialize();

  std::size_t line_number = 0;
  std::string line;
  while (g_shutdown_requested == 0) {
    const int ready = wait_for_input();
    if (ready == 0) {
      continue;
    }
    if (ready < 0) {
      // EINTR from the shutdown signal lands here too.
      continue;
    }

    if (!std::getline(std::cin, line)) {
      break;
    }
    ++line_number;
    if (line.empty()) {
      continue;
    }

    try {
      auto sample = nlohmann::json::parse(line).get<perf_analyzer::model::MetricSample>();
      if (sample.timestamp_ms == 0) {
        sample.timestamp_ms = perf_analyzer::core::unix_timestamp_now_ms();
      }
      analyzer.add_metrics(sample);
    } catch (const std::exception& ex) {
      std::cerr << "[analyzer] skipping sample on line " << line_number << ": " << ex.what() << '\n';
    }
  }

  if (g_shutdown_requested != 0) {
    std::cerr << "[analyzer] shutdown signal received; exiting cleanly\n";
  } else {
    std::cerr << "[analyzer] input closed; exiting cleanly\n";
  }

  analyzer.shutdown();
  return 0;
}
