#ifndef EXECUTOR_REQUEST_CODEC_HPP
#define EXECUTOR_REQUEST_CODEC_HPP
#include <string>

#include "proto/execution.pb.h"

namespace executor {

// Parses a JSON request such as
// {"code": "...", "runtime": "python", "budget": {"timeoutSeconds": 2}}.
// Returns false and sets error_msg if it is malformed.
bool RequestFromJson(const std::string& json,
                     proto::ExecutionRequest* request, std::string* error_msg);

// Serializes a result as a single-line JSON object. Optional fields are
// present only when set.
std::string ResultToJson(const proto::ExecutionResult& result);

// Name of a status in the JSON interface, such as "timed-out".
std::string StatusName(proto::Status status);

// Fills the unset fields of budget with the configured defaults.
void ApplyDefaultBudget(proto::Budget* budget);

// Definition of the code execution tool, as presented to the agent.
std::string ToolDefinitionJson();

}  // namespace executor

#endif
