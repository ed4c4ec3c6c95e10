#include "../services/analyzer/include/window_queue.hpp"
#include <gtest/gtest.h>

TEST(WindowQueue, DequeuesInOrderAndTracksInflight) {
    WindowQueue q;
    q.enqueue({"a", 1});
    q.enqueue({"b", 1});
    q.enqueue({"c", 1});

    auto first = q.dequeue();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->job_id, "a");

    WindowSnapshot s = q.snapshot();
    ASSERT_EQ(s.queued.size(), 2u);
    EXPECT_EQ(s.queued[0].job_id, "b");
    ASSERT_EQ(s.inflight.size(), 1u);
    EXPECT_EQ(s.inflight[0].job_id, "a");

    q.complete("a");
    EXPECT_TRUE(q.snapshot().inflight.empty());
}

TEST(WindowQueue, CancelDropsOnlyQueuedItems) {
    WindowQueue q;
    q.enqueue({"a", 2});
    q.enqueue({"b", 2});
    q.enqueue({"c", 2});
    q.dequeue();

    EXPECT_EQ(q.cancel_queued(), 2u);
    EXPECT_FALSE(q.dequeue().has_value());
    WindowSnapshot s = q.snapshot();
    EXPECT_TRUE(s.queued.empty());
    EXPECT_EQ(s.inflight.size(), 1u);
}

TEST(WindowQueue, EmptyQueue) {
    WindowQueue q;
    EXPECT_FALSE(q.dequeue().has_value());
    EXPECT_EQ(q.cancel_queued(), 0u);
}
