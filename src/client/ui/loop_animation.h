#pragma once

#include <cstdint>
#include <functional>

namespace chatimport::client {

// Frame clock of a looping animation. advance() is called from the control
// loop and reports the frame reached; a requested stop takes effect at the
// end of the loop that is playing when it is requested.
class LoopAnimation {
 public:
  using FrameCallback = std::function<void(int frame_index, int frame_count)>;
  using StoppedCallback = std::function<void()>;

  LoopAnimation(int frame_count, double frame_rate);

  void setFrameCallback(FrameCallback callback);
  void setStoppedCallback(StoppedCallback callback);

  void start(double now_seconds);
  void advance(double now_seconds);
  void stopAtNearestLoop();

  bool isRunning() const { return running_; }
  bool isStopped() const { return stopped_; }
  int frameCount() const { return frame_count_; }
  double frameRate() const { return frame_rate_; }
  int64_t loopsCompleted() const;


 private:
  int frame_count_;
  double frame_rate_;
  FrameCallback frame_callback_;
  StoppedCallback stopped_callback_;

  bool running_ = false;
  bool stopped_ = false;
  bool stop_requested_ = false;
  double start_seconds_ = 0.0;
  int64_t last_frame_ = -1;
  int64_t stop_after_loop_ = 0;
};

}  // namespace chatimport::client
