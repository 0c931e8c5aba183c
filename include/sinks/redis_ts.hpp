#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "model/analysis.hpp"

struct redisContext;

namespace perf_analyzer::sinks {

struct RedisTsOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  std::string password{};
  int db{0};
  std::string key_prefix{"perf:analyzer"};
  std::uint32_t connect_timeout_ms{1000};
};

// Publishes the scores of each Analysis into RedisTimeSeries, one TS.MADD per analysis.
class RedisTsSink {
 public:
  explicit RedisTsSink(RedisTsOptions options = {});
  ~RedisTsSink();

  RedisTsSink(const RedisTsSink&) = delete;
  RedisTsSink& operator=(const RedisTsSink&) = delete;
  RedisTsSink(RedisTsSink&&) noexcept;
  RedisTsSink& operator=(RedisTsSink&&) noexcept;

  bool check_connectivity();
  bool publish(const model::Analysis& analysis);

  // score:overall, score:<category> for every category, bottlenecks and recommendations.
  static const std::vector<std::string>& metric_suffixes();

 private:
  struct ContextDeleter {
    void operator()(redisContext* context) const;
  };

  bool ensure_connected();
  bool reconnect();
  bool authenticate();
  bool select_db();
  bool ensure_schema();
  bool publish_impl(const model::Analysis& analysis);
  void reserve_command_buffers();

  RedisTsOptions options_;
  std::unique_ptr<redisContext, ContextDeleter> context_;
  std::vector<std::string> command_args_;
  std::vector<const char*> command_argv_;
  std::vector<std::size_t> command_argv_len_;
  bool timeseries_available_{true};
  bool schema_ready_{false};
};

}  // namespace perf_analyzer::sinks
