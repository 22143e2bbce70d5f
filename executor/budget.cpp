#include "executor/budget.hpp"

#include <cmath>

#include "absl/strings/str_cat.h"
#include "util/flags.hpp"

namespace {

// Checks that value is positive and not above ceiling, lowering it to the
// ceiling if clamping is enabled.
template <typename T>
bool CheckLimit(const char* name, T ceiling, T* value, std::string* error_msg) {
  if (!(*value > 0)) {
    *error_msg = absl::StrCat(name, " must be positive");
    return false;
  }
  if (*value > ceiling) {
    if (!FLAGS_clamp_budgets) {
      *error_msg = absl::StrCat(name, " exceeds the maximum of ", ceiling);
      return false;
    }
    *value = ceiling;
  }
  return true;
}

}  // namespace

namespace executor {

bool MakeBudget(const proto::Budget& requested, ExecutionBudget* budget,
                std::string* error_msg) {
  double timeout = requested.timeout_seconds();
  int64_t memory = requested.max_memory_bytes();
  int64_t output = requested.max_output_bytes();
  if (std::isnan(timeout)) {
    *error_msg = "timeoutSeconds is not a number";
    return false;
  }
  if (!CheckLimit("timeoutSeconds", FLAGS_max_timeout_seconds, &timeout,
                  error_msg) ||
      !CheckLimit<int64_t>("maxMemoryBytes", FLAGS_max_memory_bytes, &memory,
                           error_msg) ||
      !CheckLimit<int64_t>("maxOutputBytes", FLAGS_max_output_bytes, &output,
                           error_msg)) {
    return false;
  }
  budget->wall_limit_millis = static_cast<int64_t>(std::ceil(timeout * 1000));
  budget->cpu_limit_millis =
      (static_cast<int64_t>(std::ceil(timeout)) + 1) * 1000;
  budget->memory_limit_bytes = memory;
  budget->output_limit_bytes = output;
  budget->max_procs = FLAGS_max_processes;
  budget->max_files = FLAGS_max_open_files;
  budget->max_file_size_bytes = FLAGS_max_file_size_bytes;
  return true;
}

}  // namespace executor
