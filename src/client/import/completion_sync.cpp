#include "client/import/completion_sync.h"

namespace chatimport::client {

void CompletionSync::reset() {
  estimator_ = ProgressEstimator();
  triggered_ = false;
}

bool CompletionSync::onFrame(double upload_progress, double animation_remaining_seconds, double now_seconds) {
  if (triggered_) {
    return false;
  }
  double remaining = 0.0;
  const bool known = estimator_.update(upload_progress, now_seconds, &remaining);
  return evaluate(known, remaining, animation_remaining_seconds);
}

bool CompletionSync::onFrame(double upload_progress, double animation_remaining_seconds) {
  if (triggered_) {
    return false;
  }
  double remaining = 0.0;
  const bool known = estimator_.update(upload_progress, &remaining);
  return evaluate(known, remaining, animation_remaining_seconds);
}

bool CompletionSync::force() {
  if (triggered_) {
    return false;
  }
  triggered_ = true;
  return true;
}

bool CompletionSync::evaluate(bool has_estimate, double remaining_seconds, double animation_remaining_seconds) {
  if (!has_estimate) {
    return false;
  }
  if (remaining_seconds <= animation_remaining_seconds + kSlackSeconds) {
    triggered_ = true;
    return true;
  }
  return false;
}

}  // namespace chatimport::client
