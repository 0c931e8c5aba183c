#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <exception>
#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace perf_analyzer::core {
namespace {

struct ParseState {
  bool targets_overridden{false};
};

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string lowercase(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const char c : value) {
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

bool parse_bool(const std::string& value) {
  const std::string lower = lowercase(value);
  return lower == "true" || lower == "yes" || lower == "on" || lower == "1";
}

long long parse_integer(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be a number: " + value);
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be a number: " + value);
  }
  return parsed;
}

double parse_double(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  double parsed = 0.0;
  try {
    parsed = std::stod(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be a number: " + value);
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be a number: " + value);
  }
  return parsed;
}

std::chrono::milliseconds parse_positive_ms(const std::string& key, const std::string& value) {
  const auto ms = parse_integer(key, value);
  if (ms <= 0) {
    throw std::runtime_error(key + " must be greater than 0");
  }
  return std::chrono::milliseconds(ms);
}

void apply_threshold(AnalyzerConfig& config, const std::string& key, const std::string& value) {
  const std::string rest = key.substr(std::string("thresholds.").size());
  const auto dot = rest.find('.');
  if (dot == std::string::npos) {
    throw std::runtime_error("threshold key must name a breakpoint: " + key);
  }

  ScoreThreshold* threshold = find_threshold(config.thresholds, rest.substr(0, dot));
  if (threshold == nullptr) {
    throw std::runtime_error("unknown threshold: " + rest.substr(0, dot));
  }

  const std::string field = rest.substr(dot + 1);
  if (field == "lower_is_better") {
    threshold->lower_is_better = parse_bool(value);
    return;
  }

  const double parsed = parse_double(key, value);
  if (parsed < 0.0) {
    throw std::runtime_error(key + " must be greater than or equal to 0");
  }

  if (field == "good") {
    threshold->good = parsed;
  } else if (field == "acceptable") {
    threshold->acceptable = parsed;
  } else if (field == "poor") {
    threshold->poor = parsed;
  } else {
    throw std::runtime_error("unknown threshold field: " + key);
  }
}

target_strategy parse_strategy(const std::string& value) {
  const std::string lower = lowercase(value);
  if (lower == "reduce") {
    return target_strategy::REDUCE;
  }
  if (lower == "increase") {
    return target_strategy::INCREASE;
  }
  if (lower == "stabilize") {
    return target_strategy::STABILIZE;
  }
  throw std::runtime_error("unknown target strategy: " + value);
}

void apply_target(AnalyzerConfig& config, ParseState& state, const std::string& key, const std::string& value) {
  if (!state.targets_overridden) {
    config.optimization_targets.clear();
    state.targets_overridden = true;
  }

  const std::string rest = key.substr(std::string("targets.").size());
  const auto dot = rest.find('.');
  if (dot == std::string::npos) {
    throw std::runtime_error("target key must name a field: " + key);
  }

  const std::string id = rest.substr(0, dot);
  const std::string field = rest.substr(dot + 1);

  auto it = std::find_if(config.optimization_targets.begin(), config.optimization_targets.end(),
                         [&id](const OptimizationTarget& target) { return target.id == id; });
  if (it == config.optimization_targets.end()) {
    OptimizationTarget target{};
    target.id = id;
    target.name = id;
    config.optimization_targets.push_back(target);
    it = std::prev(config.optimization_targets.end());
  }

  if (field == "name") {
    it->name = value;
  } else if (field == "metric") {
    it->metric = value;
  } else if (field == "target_value") {
    it->target_value = parse_double(key, value);
  } else if (field == "priority") {
    const auto parsed = model::parse_priority(lowercase(value));
    if (!parsed.has_value()) {
      throw std::runtime_error("unknown target priority: " + value);
    }
    it->rank = *parsed;
  } else if (field == "strategy") {
    it->strategy = parse_strategy(value);
  } else {
    throw std::runtime_error("unknown target field: " + key);
  }
}

void apply_redis_address(RedisConfig& redis, const std::string& value) {
  redis.enabled = !value.empty();
  if (value.rfind("unix://", 0) == 0) {
    redis.unix_socket = value.substr(std::string("unix://").size());
    redis.host.clear();
    redis.port = 0;
    return;
  }

  if (!value.empty() && value.front() == '/') {
    redis.unix_socket = value;
    redis.host.clear();
    redis.port = 0;
    return;
  }

  redis.unix_socket.clear();
  const auto split = value.find(':');
  if (split == std::string::npos) {
    redis.host = value;
    return;
  }

  redis.host = value.substr(0, split);
  const auto parsed_port = parse_integer("redis.address port", value.substr(split + 1));
  if (parsed_port <= 0 || parsed_port > 65535) {
    throw std::runtime_error("redis.address port must be in range 1..65535");
  }

  redis.port = static_cast<std::uint16_t>(parsed_port);
}

void apply_key_value(AnalyzerConfig& config, ParseState& state, const std::string& key, const std::string& value) {
  if (key == "analysis_interval_ms") {
    config.analysis_interval = parse_positive_ms(key, value);
    return;
  }

  if (key == "retention_period_ms") {
    config.retention_period = parse_positive_ms(key, value);
    return;
  }

  if (key == "sample_interval_ms") {
    config.sample_interval = parse_positive_ms(key, value);
    return;
  }

  if (key == "analysis_window_ms") {
    config.analysis_window = parse_positive_ms(key, value);
    return;
  }

  if (key == "stabilization_delay_ms") {
    const auto ms = parse_integer(key, value);
    if (ms < 0) {
      throw std::runtime_error("stabilization_delay_ms must be greater than or equal to 0");
    }
    config.stabilization_delay = std::chrono::milliseconds(ms);
    return;
  }

  if (key == "reporting_enabled") {
    config.reporting_enabled = parse_bool(value);
    return;
  }

  if (key == "auto_optimization") {
    config.auto_optimization = parse_bool(value);
    return;
  }

  if (key == "benchmark_enabled") {
    config.benchmark_enabled = parse_bool(value);
    return;
  }

  if (key == "debug_logging") {
    config.debug_logging = parse_bool(value);
    return;
  }

  if (key == "output_dir") {
    config.output_dir = value;
    return;
  }

  if (key == "sinks.stdout") {
    config.stdout_debug = parse_bool(value);
    return;
  }

  if (key == "redis.address") {
    apply_redis_address(config.redis, value);
    return;
  }

  if (key == "redis.key_prefix") {
    config.redis.key_prefix = value;
    return;
  }

  if (key == "redis.password") {
    config.redis.password = value;
    return;
  }

  if (key == "redis.db") {
    const auto db = parse_integer(key, value);
    if (db < 0 || db > 65535) {
      throw std::runtime_error("redis.db must be in range 0..65535");
    }
    config.redis.db = static_cast<int>(db);
    return;
  }

  if (key.rfind("thresholds.", 0) == 0) {
    apply_threshold(config, key, value);
    return;
  }

  if (key.rfind("targets.", 0) == 0) {
    apply_target(config, state, key, value);
  }
}

}  // namespace

std::vector<OptimizationTarget> AnalyzerConfig::default_optimization_targets() {
  return {
      {"response-time", "Response Time Optimization", "application.responseTime", 200.0, model::priority::HIGH,
       target_strategy::REDUCE},
      {"throughput", "Throughput Optimization", "application.throughput", 1000.0, model::priority::MEDIUM,
       target_strategy::INCREASE},
      {"cpu-usage", "CPU Usage Optimization", "system.cpu", 60.0, model::priority::HIGH, target_strategy::REDUCE},
  };
}

ScoreThreshold* find_threshold(ScoreThresholds& thresholds, const std::string& name) noexcept {
  if (name == "response_time") {
    return &thresholds.response_time;
  }
  if (name == "throughput") {
    return &thresholds.throughput;
  }
  if (name == "cpu_usage") {
    return &thresholds.cpu_usage;
  }
  if (name == "memory_usage") {
    return &thresholds.memory_usage;
  }
  if (name == "error_rate") {
    return &thresholds.error_rate;
  }
  if (name == "disk_usage") {
    return &thresholds.disk_usage;
  }
  if (name == "network_latency") {
    return &thresholds.network_latency;
  }
  return nullptr;
}

const ScoreThreshold* find_threshold(const ScoreThresholds& thresholds, const std::string& name) noexcept {
  return find_threshold(const_cast<ScoreThresholds&>(thresholds), name);
}

const char* to_string(const target_strategy strategy) noexcept {
  switch (strategy) {
    case target_strategy::REDUCE:
      return "reduce";
    case target_strategy::INCREASE:
      return "increase";
    case target_strategy::STABILIZE:
      return "stabilize";
  }
  return "reduce";
}

AnalyzerConfig load_analyzer_config(const std::string& path) {
  AnalyzerConfig config{};
  ParseState state{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  std::size_t line_number = 0;
  while (std::getline(input, line)) {
    ++line_number;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (depth > sections.size()) {
      throw std::runtime_error("unexpected indentation at line " + std::to_string(line_number) + " of " + path);
    }
    sections.resize(depth);

    if (value.empty()) {
      sections.push_back(key);
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, state, full_key.str(), value);
  }

  for (const auto& target : config.optimization_targets) {
    if (target.metric.empty()) {
      throw std::runtime_error("target " + target.id + " is missing a metric");
    }
  }

  return config;
}

}  // namespace perf_analyzer::core
