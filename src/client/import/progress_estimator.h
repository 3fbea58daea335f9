#pragma once

namespace chatimport::client {

// Estimates the time left for a progress fraction from an exponentially
// weighted average of its rate. Sampled at the caller's cadence (one call
// per animation frame), so the smoothing is tuned for sub-second intervals.
class ProgressEstimator {
 public:
  static constexpr double kSmoothing = 0.05;
  static constexpr double kMinRatePerSecond = 0.0001;
  static constexpr double kMinProgressDelta = 0.01;
  static constexpr double kMinTimeDeltaSeconds = 1.0;

  // Returns true and fills remaining_seconds when the rate is known.
  bool update(double progress, double* remaining_seconds);
  bool update(double progress, double now_seconds, double* remaining_seconds);

  double averageRate() const { return average_rate_; }
  bool hasSample() const { return has_sample_; }

 private:
  double average_rate_ = 0.0;
  bool has_sample_ = false;
  double last_timestamp_ = 0.0;
  double last_progress_ = 0.0;
};

}  // namespace chatimport::client
