#ifndef EXECUTOR_BUDGET_HPP
#define EXECUTOR_BUDGET_HPP
#include <cstdint>
#include <string>

#include "proto/execution.pb.h"

namespace executor {

// Effective limits of one execution, after validation against the host
// ceilings.
struct ExecutionBudget {
  int64_t wall_limit_millis = 0;
  // Timeout rounded up to a second, plus one second.
  int64_t cpu_limit_millis = 0;
  int64_t memory_limit_bytes = 0;
  int64_t output_limit_bytes = 0;
  int32_t max_procs = 0;
  int32_t max_files = 0;
  int64_t max_file_size_bytes = 0;
};

// Computes the budget for the requested limits. Limits above the host
// ceilings are lowered to the ceiling if --clamp_budgets is set. Returns
// false and sets error_msg if the requested limits are not acceptable.
bool MakeBudget(const proto::Budget& requested, ExecutionBudget* budget,
                std::string* error_msg);

}  // namespace executor

#endif
