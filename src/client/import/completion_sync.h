#pragma once

#include "client/import/progress_estimator.h"

namespace chatimport::client {

// One-shot latch deciding when the looping progress animation may start its
// finishing transition: as soon as the upload is expected to end no later
// than kSlackSeconds after the animation's current loop.
class CompletionSync {
 public:
  static constexpr double kSlackSeconds = 1.0;

  void reset();

  // Returns true only on the call that fires the latch.
  bool onFrame(double upload_progress, double animation_remaining_seconds, double now_seconds);
  bool onFrame(double upload_progress, double animation_remaining_seconds);
  // Fires the latch regardless of estimates, e.g. once the upload is done.
  bool force();

  bool triggered() const { return triggered_; }
  const ProgressEstimator& estimator() const { return estimator_; }

 private:
  bool evaluate(bool has_estimate, double remaining_seconds, double animation_remaining_seconds);

  ProgressEstimator estimator_;
  bool triggered_ = false;
};

}  // namespace chatimport::client
