#include "model/analysis.hpp"

namespace perf_analyzer::model {

const char* to_string(const health_status value) noexcept {
  switch (value) {
    case health_status::EXCELLENT:
      return "excellent";
    case health_status::GOOD:
      return "good";
    case health_status::ACCEPTABLE:
      return "acceptable";
    case health_status::POOR:
      return "poor";
    case health_status::CRITICAL:
      return "critical";
  }
  return "critical";
}

const char* to_string(const trend value) noexcept {
  switch (value) {
    case trend::IMPROVING:
      return "improving";
    case trend::STABLE:
      return "stable";
    case trend::DEGRADING:
      return "degrading";
  }
  return "stable";
}

const char* to_string(const priority value) noexcept {
  switch (value) {
    case priority::LOW:
      return "low";
    case priority::MEDIUM:
      return "medium";
    case priority::HIGH:
      return "high";
    case priority::CRITICAL:
      return "critical";
  }
  return "low";
}

const char* to_string(const level value) noexcept {
  switch (value) {
    case level::LOW:
      return "low";
    case level::MEDIUM:
      return "medium";
    case level::HIGH:
      return "high";
  }
  return "low";
}

const char* to_string(const comparison value) noexcept {
  switch (value) {
    case comparison::BETTER:
      return "better";
    case comparison::SAME:
      return "same";
    case comparison::WORSE:
      return "worse";
  }
  return "same";
}

const char* to_string(const optimization_status value) noexcept {
  switch (value) {
    case optimization_status::SUCCESS:
      return "success";
    case optimization_status::PARTIAL:
      return "partial";
    case optimization_status::FAILED:
      return "failed";
  }
  return "failed";
}

std::optional<priority> parse_priority(const std::string_view text) noexcept {
  if (text == "low") {
    return priority::LOW;
  }
  if (text == "medium") {
    return priority::MEDIUM;
  }
  if (text == "high") {
    return priority::HIGH;
  }
  if (text == "critical") {
    return priority::CRITICAL;
  }
  return std::nullopt;
}

std::optional<level> parse_level(const std::string_view text) noexcept {
  if (text == "low") {
    return level::LOW;
  }
  if (text == "medium") {
    return level::MEDIUM;
  }
  if (text == "high") {
    return level::HIGH;
  }
  return std::nullopt;
}

}  // namespace perf_analyzer::model
