#include "executor/runtime.hpp"

#include "absl/strings/ascii.h"

namespace executor {

namespace {

const std::vector<Runtime>& Runtimes() {
  static const std::vector<Runtime>* runtimes = new std::vector<Runtime>{
      // Unbuffered, so that output written before a crash is not lost, and
      // without user site packages or PYTHON* variables of the host.
      {"python", "python3", {"-u", "-E", "-s"}, "main.py"},
      {"python3", "python3", {"-u", "-E", "-s"}, "main.py"},
      {"bash", "bash", {}, "main.sh"},
      {"sh", "sh", {}, "main.sh"},
      {"node", "node", {}, "main.js"},
      {"javascript", "node", {}, "main.js"},
      {"ruby", "ruby", {}, "main.rb"},
      {"perl", "perl", {}, "main.pl"},
  };
  return *runtimes;
}

}  // namespace

absl::optional<Runtime> FindRuntime(const std::string& id) {
  std::string lower = absl::AsciiStrToLower(id);
  for (const Runtime& runtime : Runtimes()) {
    if (runtime.id == lower) return runtime;
  }
  return absl::nullopt;
}

std::vector<std::string> KnownRuntimes() {
  std::vector<std::string> ids;
  for (const Runtime& runtime : Runtimes()) ids.push_back(runtime.id);
  return ids;
}

}  // namespace executor
