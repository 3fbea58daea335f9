#include "client/import/progress_estimator.h"

#include <chrono>
#include <cmath>

namespace chatimport::client {

namespace {

double monotonicSeconds() {
  const auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
  return std::chrono::duration<double>(since_epoch).count();
}

}  // namespace

bool ProgressEstimator::update(double progress, double* remaining_seconds) {
  return update(progress, monotonicSeconds(), remaining_seconds);
}

bool ProgressEstimator::update(double progress, double now_seconds, double* remaining_seconds) {
  if (has_sample_) {
    const double progress_delta = progress - last_progress_;
    const double time_delta = now_seconds - last_timestamp_;
    if ((std::fabs(progress_delta) >= kMinProgressDelta || std::fabs(time_delta) > kMinTimeDeltaSeconds) &&
        time_delta != 0.0) {
      const double instant_rate = progress_delta / time_delta;
      average_rate_ = kSmoothing * instant_rate + (1.0 - kSmoothing) * average_rate_;
      last_timestamp_ = now_seconds;
      last_progress_ = progress;
    }
  } else {
    has_sample_ = true;
    last_timestamp_ = now_seconds;
    last_progress_ = progress;
  }

  if (average_rate_ < kMinRatePerSecond) {
    return false;
  }
  if (remaining_seconds) {
    *remaining_seconds = (1.0 - progress) / average_rate_;
  }
  return true;
}

}  // namespace chatimport::client
