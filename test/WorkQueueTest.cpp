#include "gtest/gtest.h"
#include "../src/copy/WorkQueue.hpp"
#include <thread>

TEST(WorkQueueTest, HandsOutSlicesInFifoOrder)
{
    WorkQueue queue;
    for (int i = 0; i < 4; ++i) {
        queue.add_slice(i);
    }
    queue.mark_finished();
    EXPECT_EQ(queue.size(), 4u);

    int index = -1;
    for (int expected = 0; expected < 4; ++expected) {
        ASSERT_TRUE(queue.get_slice(index));
        EXPECT_EQ(index, expected);
    }
    EXPECT_FALSE(queue.get_slice(index));
}

TEST(WorkQueueTest, CancelDropsPendingSlices)
{
    WorkQueue queue;
    for (int i = 0; i < 5; ++i) {
        queue.add_slice(i);
    }

    int index = -1;
    ASSERT_TRUE(queue.get_slice(index));
    EXPECT_EQ(index, 0);

    std::vector<int> dropped = queue.cancel();
    EXPECT_EQ(dropped, (std::vector<int>{1, 2, 3, 4}));
    EXPECT_TRUE(queue.is_cancelled());
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_FALSE(queue.get_slice(index));

    queue.add_slice(9);
    EXPECT_EQ(queue.size(), 0u);
}

TEST(WorkQueueTest, CancelWakesBlockedWorker)
{
    WorkQueue queue;
    bool got = true;
    std::thread worker([&]() {
        int index;
        got = queue.get_slice(index);
    });
    queue.cancel();
    worker.join();
    EXPECT_FALSE(got);
}
