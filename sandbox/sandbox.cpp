#include "sandbox/sandbox.hpp"

#include "glog/logging.h"
#include "util/file.hpp"

namespace sandbox {

Sandbox::store_t* Sandbox::Boxes_() {
  static store_t* boxes = new store_t;
  return boxes;
}

void Sandbox::Register_(Sandbox::create_t create, Sandbox::score_t score) {
  Boxes_()->emplace_back(create, score);
}

std::unique_ptr<Sandbox> Sandbox::Create() {
  static const unsigned best_sandbox = []() {
    const store_t& boxes = *Boxes_();
    unsigned best = -1U;
    int best_score = 0;
    for (unsigned i = 0; i < boxes.size(); i++) {
      int score = boxes[i].second();
      if (score > best_score) {
        best_score = score;
        best = i;
      }
    }
    return best;
  }();
  if (best_sandbox == -1U) {
    LOG(ERROR) << "No sandbox could be found";
    return nullptr;
  }
  return std::unique_ptr<Sandbox>((*Boxes_())[best_sandbox].first());
}

bool Sandbox::Execute(const ExecutionOptions& options, ExecutionInfo* info,
                      std::string* error_msg) {
  if (options.executable.empty()) {
    *error_msg = "No executable specified";
    return false;
  }
  if (options.prepare_executable) {
    if (!PrepareForExecution(
            util::File::JoinPath(options.root, options.executable),
            error_msg)) {
      return false;
    }
  }
  return ExecuteInternal(options, info, error_msg);
}

}  // namespace sandbox
