#ifndef CORE_LIMITS_HPP
#define CORE_LIMITS_HPP

#include <stdint.h>

namespace core {

// Resource bounds for one snippet execution.
struct ExecutionLimits {
  static const constexpr char* kTimeoutVariable = "TIMEOUT";
  static const constexpr char* kMaxOutputVariable = "MAX_OUTPUT_KB";

  // Wall-clock seconds the snippet may run for.
  int64_t timeout_seconds = 30;
  // Cap on each captured stream, in KiB.
  int64_t max_output_kb = 256;

  int64_t TimeoutMillis() const { return timeout_seconds * 1000; }
  int64_t MaxOutputBytes() const { return max_output_kb * 1024; }

  // Reads TIMEOUT and MAX_OUTPUT_KB. Unset or empty variables keep the
  // default value. Throws std::invalid_argument if a value is not a positive
  // integer.
  static ExecutionLimits FromEnvironment();
};

}  // namespace core

#endif
