#pragma once

#include "model/analysis.hpp"

namespace perf_analyzer::sinks {

class StdoutDebugSink {
 public:
  void publish(const model::Analysis& analysis) const;
};

}  // namespace perf_analyzer::sinks
