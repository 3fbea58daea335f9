#include "client/import/completion_sync.h"

#include <gtest/gtest.h>

namespace chatimport::client {
namespace {

TEST(CompletionSyncTest, WaitsForAnEstimate) {
  CompletionSync sync;
  EXPECT_FALSE(sync.onFrame(0.99, 10.0, 0.0));
  EXPECT_FALSE(sync.triggered());
}

TEST(CompletionSyncTest, FiresOnceWhenUploadCatchesUp) {
  CompletionSync sync;
  EXPECT_FALSE(sync.onFrame(0.0, 3.0, 0.0));
  // Rate 0.025/s leaves 20 s against 3 s of animation.
  EXPECT_FALSE(sync.onFrame(0.5, 3.0, 1.0));
  EXPECT_FALSE(sync.triggered());
  // Rate 0.04375/s leaves about 2.3 s.
  EXPECT_TRUE(sync.onFrame(0.9, 3.0, 2.0));
  EXPECT_TRUE(sync.triggered());

  EXPECT_FALSE(sync.onFrame(0.95, 3.0, 3.0));
  EXPECT_FALSE(sync.force());
  EXPECT_TRUE(sync.triggered());
}

TEST(CompletionSyncTest, SlackCountsTowardsTheAnimation) {
  CompletionSync sync;
  sync.onFrame(0.0, 0.0, 0.0);
  sync.onFrame(0.5, 0.0, 1.0);
  // 20 s left: not within 18 + 1 s, but within 19 + 1 s.
  EXPECT_FALSE(sync.onFrame(0.5, 18.0, 1.5));
  EXPECT_TRUE(sync.onFrame(0.5, 19.0, 1.6));
}

TEST(CompletionSyncTest, ForceFiresOnce) {
  CompletionSync sync;
  EXPECT_TRUE(sync.force());
  EXPECT_TRUE(sync.triggered());
  EXPECT_FALSE(sync.force());
}

TEST(CompletionSyncTest, ResetClearsLatchAndEstimate) {
  CompletionSync sync;
  sync.onFrame(0.5, 1.0, 0.0);
  sync.force();

  sync.reset();
  EXPECT_FALSE(sync.triggered());
  EXPECT_FALSE(sync.estimator().hasSample());
  EXPECT_FALSE(sync.onFrame(0.0, 1.0, 10.0));
}

}  // namespace
}  // namespace chatimport::client
