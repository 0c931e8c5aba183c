#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include <hiredis/hiredis.h>

#include "model/analysis.hpp"
#include "sinks/redis_ts.hpp"
#include "sinks/stdout_debug.hpp"

using perf_analyzer::model::Analysis;
using perf_analyzer::model::Bottleneck;
using perf_analyzer::model::CategoryScore;
using perf_analyzer::model::OptimizationRecommendation;
using perf_analyzer::sinks::RedisTsOptions;
using perf_analyzer::sinks::RedisTsSink;
using perf_analyzer::sinks::StdoutDebugSink;

namespace {

struct RedisMockState {
  std::vector<std::string> last_argv{};
  int command_argv_calls{0};
  int command_calls{0};
  std::vector<std::string> commands{};
  const char* create_error{nullptr};
};

RedisMockState g_redis_mock{};

extern "C" {

redisContext* redisConnectWithTimeout(const char*, int, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

redisContext* redisConnectUnixWithTimeout(const char*, const struct timeval) {
  auto* context = static_cast<redisContext*>(std::calloc(1, sizeof(redisContext)));
  context->err = REDIS_OK;
  return context;
}

void redisFree(redisContext* c) { std::free(c); }

void* redisCommand(redisContext*, const char* format, ...) {
  g_redis_mock.command_calls += 1;
  char formatted[256]{};
  va_list args;
  va_start(args, format);
  std::vsnprintf(formatted, sizeof(formatted), format, args);
  va_end(args);
  g_redis_mock.commands.emplace_back(formatted);

  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  if (g_redis_mock.create_error != nullptr) {
    reply->type = REDIS_REPLY_ERROR;
    reply->str = const_cast<char*>(g_redis_mock.create_error);
  } else {
    reply->type = REDIS_REPLY_STATUS;
  }
  return reply;
}

void* redisCommandArgv(redisContext*, int argc, const char** argv, const size_t*) {
  g_redis_mock.command_argv_calls += 1;
  g_redis_mock.last_argv.clear();
  for (int i = 0; i < argc; ++i) {
    g_redis_mock.last_argv.emplace_back(argv[i]);
  }
  auto* reply = static_cast<redisReply*>(std::calloc(1, sizeof(redisReply)));
  reply->type = REDIS_REPLY_ARRAY;
  return reply;
}

// Reply strings point at static storage in this mock; only the reply itself is heap allocated.
void freeReplyObject(void* reply) { std::free(reply); }

}  // extern "C"

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

Analysis sample_analysis() {
  Analysis analysis{};
  analysis.timestamp_ms = 1700000000123ULL;
  analysis.overall_score = 72.5;

  CategoryScore system{};
  system.score = 80.0;
  CategoryScore application{};
  application.score = 43.25;
  analysis.categories.emplace("system", system);
  analysis.categories.emplace("application", application);

  Bottleneck cpu{};
  cpu.id = "bottleneck-cpu";
  cpu.type = "cpu";
  analysis.bottlenecks.push_back(cpu);

  OptimizationRecommendation first{};
  first.id = "fix-cpu-bottleneck";
  OptimizationRecommendation second{};
  second.id = "application-optimization";
  analysis.recommendations.push_back(first);
  analysis.recommendations.push_back(second);
  return analysis;
}

// Returns the value argument following key, or an empty string when the key was not sent.
std::string value_for(const std::vector<std::string>& argv, const std::string& key) {
  for (std::size_t i = 1; i + 2 < argv.size(); i += 3) {
    if (argv[i] == key) {
      return argv[i + 2];
    }
  }
  return {};
}

int test_redis_sink_publishes_scores() {
  g_redis_mock = {};

  RedisTsOptions options;
  options.key_prefix = "perf:test";

  RedisTsSink sink(options);
  const Analysis analysis = sample_analysis();
  if (!sink.publish(analysis)) {
    return fail("test_redis_sink_publishes_scores", "publish should succeed with mock redis");
  }

  if (g_redis_mock.command_argv_calls != 1) {
    return fail("test_redis_sink_publishes_scores", "expected one TS.MADD call");
  }
  const auto& argv = g_redis_mock.last_argv;
  if (argv.empty() || argv.front() != "TS.MADD") {
    return fail("test_redis_sink_publishes_scores", "TS.MADD command not emitted");
  }
  // overall, two categories, bottlenecks and recommendations
  if (argv.size() != 1 + (5 * 3)) {
    return fail("test_redis_sink_publishes_scores", "unexpected TS.MADD argument count");
  }
  if (argv[2] != "1700000000123") {
    return fail("test_redis_sink_publishes_scores", "samples should carry the analysis timestamp");
  }
  if (value_for(argv, "perf:test:score:overall").find("72.5") != 0) {
    return fail("test_redis_sink_publishes_scores", "overall score missing");
  }
  if (value_for(argv, "perf:test:score:application").find("43.25") != 0) {
    return fail("test_redis_sink_publishes_scores", "application score missing");
  }
  if (value_for(argv, "perf:test:bottlenecks").find('1') != 0) {
    return fail("test_redis_sink_publishes_scores", "bottleneck count missing");
  }
  if (value_for(argv, "perf:test:recommendations").find('2') != 0) {
    return fail("test_redis_sink_publishes_scores", "recommendation count missing");
  }
  if (!value_for(argv, "perf:test:score:network").empty()) {
    return fail("test_redis_sink_publishes_scores", "categories absent from the analysis should not be sent");
  }

  // One TS.CREATE per metric key on first connect only.
  const int creates = g_redis_mock.command_calls;
  if (creates != static_cast<int>(RedisTsSink::metric_suffixes().size())) {
    return fail("test_redis_sink_publishes_scores", "expected one TS.CREATE per metric key");
  }
  if (!sink.publish(analysis) || g_redis_mock.command_calls != creates) {
    return fail("test_redis_sink_publishes_scores", "schema should only be created once");
  }

  return 0;
}

int test_redis_sink_disables_without_timeseries_module() {
  g_redis_mock = {};
  g_redis_mock.create_error = "ERR unknown command 'TS.CREATE'";

  RedisTsSink sink(RedisTsOptions{});
  if (sink.publish(sample_analysis())) {
    return fail("test_redis_sink_disables_without_timeseries_module", "publish should fail without the module");
  }
  const int calls = g_redis_mock.command_calls;
  if (sink.publish(sample_analysis()) || sink.check_connectivity()) {
    return fail("test_redis_sink_disables_without_timeseries_module", "sink should stay disabled");
  }
  if (g_redis_mock.command_calls != calls || g_redis_mock.command_argv_calls != 0) {
    return fail("test_redis_sink_disables_without_timeseries_module", "disabled sink should not talk to redis");
  }

  return 0;
}

int test_redis_sink_tolerates_existing_keys() {
  g_redis_mock = {};
  g_redis_mock.create_error = "ERR TSDB: key already exists";

  RedisTsSink sink(RedisTsOptions{});
  if (!sink.publish(sample_analysis())) {
    return fail("test_redis_sink_tolerates_existing_keys", "existing series should not block publishing");
  }
  if (g_redis_mock.command_argv_calls != 1) {
    return fail("test_redis_sink_tolerates_existing_keys", "expected one TS.MADD call");
  }

  return 0;
}

int test_redis_sink_authenticates_and_selects_db() {
  g_redis_mock = {};

  RedisTsOptions options;
  options.password = "hunter2";
  options.db = 3;
  options.key_prefix = "perf:test";

  RedisTsSink sink(options);
  if (!sink.publish(sample_analysis())) {
    return fail("test_redis_sink_authenticates_and_selects_db", "publish should succeed with mock redis");
  }

  const auto& commands = g_redis_mock.commands;
  if (commands.size() < 3 || commands[0] != "AUTH hunter2" || commands[1] != "SELECT 3") {
    return fail("test_redis_sink_authenticates_and_selects_db", "AUTH then SELECT should precede schema setup");
  }
  if (commands[2] != "TS.CREATE perf:test:score:overall DUPLICATE_POLICY LAST") {
    return fail("test_redis_sink_authenticates_and_selects_db", "schema setup should follow SELECT");
  }

  g_redis_mock = {};
  RedisTsSink plain(RedisTsOptions{});
  if (!plain.publish(sample_analysis())) {
    return fail("test_redis_sink_authenticates_and_selects_db", "publish without credentials should succeed");
  }
  for (const auto& command : g_redis_mock.commands) {
    if (command.rfind("AUTH", 0) == 0 || command.rfind("SELECT", 0) == 0) {
      return fail("test_redis_sink_authenticates_and_selects_db", "no AUTH or SELECT without credentials");
    }
  }

  return 0;
}

int test_stdout_sink_smoke() {
  const StdoutDebugSink sink{};
  sink.publish(sample_analysis());
  sink.publish(Analysis{});
  return 0;
}

}  // namespace

int main() {
  if (test_redis_sink_publishes_scores() != 0 || test_redis_sink_disables_without_timeseries_module() != 0 ||
      test_redis_sink_tolerates_existing_keys() != 0 || test_redis_sink_authenticates_and_selects_db() != 0 ||
      test_stdout_sink_smoke() != 0) {
    return 1;
  }

  std::cout << "[PASS] sinks unit tests\n";
  return 0;
}
