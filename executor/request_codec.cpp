#include "executor/request_codec.hpp"

#include "executor/runtime.hpp"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/util/json_util.h"
#include "util/flags.hpp"

namespace executor {

namespace {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

Value StringValue(const std::string& s) {
  Value value;
  value.set_string_value(s);
  return value;
}

Value NumberValue(double d) {
  Value value;
  value.set_number_value(d);
  return value;
}

Value Property(const std::string& type, const std::string& description) {
  Value value;
  Struct* fields = value.mutable_struct_value();
  (*fields->mutable_fields())["type"] = StringValue(type);
  (*fields->mutable_fields())["description"] = StringValue(description);
  return value;
}

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto status = google::protobuf::util::MessageToJsonString(message, &json);
  // Only fails for messages that cannot be represented, like NaN numbers.
  if (!status.ok()) return "{}";
  return json;
}

}  // namespace

bool RequestFromJson(const std::string& json,
                     proto::ExecutionRequest* request,
                     std::string* error_msg) {
  // The tool definition exposes the timeout as a top level field.
  Struct fields;
  auto status = google::protobuf::util::JsonStringToMessage(json, &fields);
  if (!status.ok()) {
    *error_msg = "Malformed request: " + status.ToString();
    return false;
  }
  std::string request_json = json;
  auto timeout = fields.fields().find("timeout");
  double timeout_seconds = 0;
  if (timeout != fields.fields().end()) {
    if (timeout->second.kind_case() != Value::kNumberValue) {
      *error_msg = "Malformed request: timeout must be a number";
      return false;
    }
    timeout_seconds = timeout->second.number_value();
    fields.mutable_fields()->erase("timeout");
    request_json = ToJson(fields);
  }
  status = google::protobuf::util::JsonStringToMessage(request_json, request);
  if (!status.ok()) {
    *error_msg = "Malformed request: " + status.ToString();
    return false;
  }
  if (timeout_seconds != 0 && request->budget().timeout_seconds() == 0) {
    request->mutable_budget()->set_timeout_seconds(timeout_seconds);
  }
  return true;
}

std::string StatusName(proto::Status status) {
  switch (status) {
    case proto::Status::OK:
      return "ok";
    case proto::Status::TIMED_OUT:
      return "timed-out";
    case proto::Status::MEMORY_EXCEEDED:
      return "memory-exceeded";
    case proto::Status::OUTPUT_TRUNCATED:
      return "output-truncated";
    case proto::Status::CRASHED:
      return "crashed";
    case proto::Status::REJECTED:
      return "rejected";
    case proto::Status::SANDBOX_UNAVAILABLE:
      return "sandbox-unavailable";
    case proto::Status::CANCELLED:
      return "cancelled";
    default:
      return "unknown";
  }
}

std::string ResultToJson(const proto::ExecutionResult& result) {
  Struct json;
  auto& fields = *json.mutable_fields();
  fields["status"] = StringValue(StatusName(result.status()));
  if (result.has_exit_code()) {
    fields["exitCode"] = NumberValue(result.exit_code());
  }
  if (result.signal() != 0) fields["signal"] = NumberValue(result.signal());
  fields["stdout"] = StringValue(result.stdout_data());
  fields["stderr"] = StringValue(result.stderr_data());
  fields["elapsedMs"] = NumberValue(result.elapsed_ms());
  if (result.has_peak_memory_bytes()) {
    fields["peakMemoryBytes"] = NumberValue(result.peak_memory_bytes());
  }
  if (result.approximate_memory()) {
    fields["approximateMemory"].set_bool_value(true);
  }
  if (!result.error_message().empty()) {
    fields["error"] = StringValue(result.error_message());
  }
  return ToJson(json);
}

void ApplyDefaultBudget(proto::Budget* budget) {
  if (budget->timeout_seconds() == 0) {
    budget->set_timeout_seconds(FLAGS_default_timeout_seconds);
  }
  if (budget->max_memory_bytes() == 0) {
    budget->set_max_memory_bytes(FLAGS_default_memory_bytes);
  }
  if (budget->max_output_bytes() == 0) {
    budget->set_max_output_bytes(FLAGS_default_output_bytes);
  }
}

std::string ToolDefinitionJson() {
  Struct tool;
  auto& fields = *tool.mutable_fields();
  fields["name"] = StringValue("code_executor");
  fields["description"] = StringValue(
      "Execute code in an isolated sandbox and return its output");

  Struct* parameters = fields["parameters"].mutable_struct_value();
  (*parameters->mutable_fields())["type"] = StringValue("object");
  Struct* properties =
      (*parameters->mutable_fields())["properties"].mutable_struct_value();
  auto& props = *properties->mutable_fields();
  props["code"] = Property("string", "Code to execute");
  props["runtime"] = Property("string", "Language runtime of the code");
  ListValue* runtimes = (*props["runtime"].mutable_struct_value()
                              ->mutable_fields())["enum"]
                            .mutable_list_value();
  for (const std::string& id : KnownRuntimes()) {
    *runtimes->add_values() = StringValue(id);
  }
  (*props["runtime"].mutable_struct_value()->mutable_fields())["default"] =
      StringValue("python");
  props["input"] = Property("string", "Data fed to the standard input");
  props["timeout"] = Property("integer", "Maximum execution time in seconds");
  (*props["timeout"].mutable_struct_value()->mutable_fields())["default"] =
      NumberValue(FLAGS_default_timeout_seconds);

  ListValue* required =
      (*parameters->mutable_fields())["required"].mutable_list_value();
  *required->add_values() = StringValue("code");
  return ToJson(tool);
}

}  // namespace executor
