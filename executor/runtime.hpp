#ifndef EXECUTOR_RUNTIME_HPP
#define EXECUTOR_RUNTIME_HPP
#include <string>
#include <vector>

#include "absl/types/optional.h"

namespace executor {

// How to run the code of a language.
struct Runtime {
  std::string id;
  // Command looked up on PATH.
  std::string interpreter;
  // Arguments passed to the interpreter before the source file.
  std::vector<std::string> args;
  // Name of the file the code is written to, in the working directory.
  std::string source_file;
};

// Looks up a runtime by identifier, ignoring case.
absl::optional<Runtime> FindRuntime(const std::string& id);

// Identifiers of all the supported runtimes.
std::vector<std::string> KnownRuntimes();

}  // namespace executor

#endif
