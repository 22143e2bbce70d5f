#include "sandbox/limiter.hpp"

#include "glog/logging.h"

namespace sandbox {

Limiter::store_t* Limiter::Limiters_() {
  static store_t* limiters = new store_t;
  return limiters;
}

void Limiter::Register_(Limiter::create_t create, Limiter::score_t score) {
  Limiters_()->emplace_back(create, score);
}

std::unique_ptr<Limiter> Limiter::Create() {
  static const unsigned best_limiter = []() {
    const store_t& limiters = *Limiters_();
    unsigned best = -1U;
    int best_score = 0;
    for (unsigned i = 0; i < limiters.size(); i++) {
      int score = limiters[i].second();
      if (score > best_score) {
        best_score = score;
        best = i;
      }
    }
    return best;
  }();
  if (best_limiter == -1U) {
    LOG(ERROR) << "No resource limiter could be found";
    return nullptr;
  }
  return std::unique_ptr<Limiter>((*Limiters_())[best_limiter].first());
}

}  // namespace sandbox
