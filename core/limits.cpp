#include "core/limits.hpp"

#include <stdlib.h>

#include <limits>
#include <stdexcept>
#include <string>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"

namespace {
// Keeps the conversions to milliseconds and bytes from overflowing.
static const constexpr int64_t kMaxValue =
    std::numeric_limits<int64_t>::max() / 1024;

void ReadVariable(const char* name, int64_t* value) {
  const char* raw = getenv(name);
  if (raw == nullptr || raw[0] == '\0') return;
  int64_t parsed = 0;
  if (!absl::SimpleAtoi(raw, &parsed) || parsed <= 0 || parsed > kMaxValue) {
    throw std::invalid_argument(absl::StrCat(
        name, " must be a positive integer, got \"", raw, "\""));
  }
  *value = parsed;
}
}  // namespace

namespace core {

ExecutionLimits ExecutionLimits::FromEnvironment() {
  ExecutionLimits limits;
  ReadVariable(kTimeoutVariable, &limits.timeout_seconds);
  ReadVariable(kMaxOutputVariable, &limits.max_output_kb);
  return limits;
}

}  // namespace core
