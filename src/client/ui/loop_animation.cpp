#include "client/ui/loop_animation.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace chatimport::client {

LoopAnimation::LoopAnimation(int frame_count, double frame_rate)
    : frame_count_(std::max(frame_count, 1)), frame_rate_(frame_rate > 0.0 ? frame_rate : 60.0) {}

void LoopAnimation::setFrameCallback(FrameCallback callback) {
  frame_callback_ = std::move(callback);
}

void LoopAnimation::setStoppedCallback(StoppedCallback callback) {
  stopped_callback_ = std::move(callback);
}

void LoopAnimation::start(double now_seconds) {
  running_ = true;
  stopped_ = false;
  stop_requested_ = false;
  start_seconds_ = now_seconds;
  last_frame_ = -1;
  stop_after_loop_ = 0;
}

void LoopAnimation::advance(double now_seconds) {
  if (!running_) {
    return;
  }
  const double elapsed = std::max(0.0, now_seconds - start_seconds_);
  const auto frame = static_cast<int64_t>(std::floor(elapsed * frame_rate_));
  if (frame == last_frame_) {
    return;
  }

  if (stop_requested_ && frame >= (stop_after_loop_ + 1) * frame_count_) {
    last_frame_ = (stop_after_loop_ + 1) * frame_count_ - 1;
    running_ = false;
    stopped_ = true;
    if (stopped_callback_) {
      stopped_callback_();
    }
    return;
  }

  last_frame_ = frame;
  if (frame_callback_) {
    frame_callback_(static_cast<int>(frame % frame_count_), frame_count_);
  }
}

void LoopAnimation::stopAtNearestLoop() {
  if (!running_ || stop_requested_) {
    return;
  }
  stop_requested_ = true;
  stop_after_loop_ = last_frame_ < 0 ? 0 : last_frame_ / frame_count_;
}

int64_t LoopAnimation::loopsCompleted() const {
  if (last_frame_ < 0) {
    return 0;
  }
  return (last_frame_ + 1) / frame_count_;
}

}  // namespace chatimport::client
