#include <gtest/gtest.h>
#include <chrono>
#include <thread>

#include "crowd/core/frame_store.h"

using crowd::core::FrameStore;

TEST(FrameStoreTest, WaitTimesOutWhenEmpty) {
    FrameStore store;
    cv::Mat out;
    EXPECT_FALSE(store.waitFrame(out, 10));
}

TEST(FrameStoreTest, EachFrameIsDeliveredOnce) {
    FrameStore store;
    store.pushFrame(cv::Mat(4, 6, CV_8UC3, cv::Scalar(1, 2, 3)));
    EXPECT_EQ(store.sequence(), 1u);

    cv::Mat out;
    ASSERT_TRUE(store.waitFrame(out, 10));
    EXPECT_EQ(out.cols, 6);
    EXPECT_EQ(out.rows, 4);
    EXPECT_FALSE(store.waitFrame(out, 10));
}

TEST(FrameStoreTest, KeepsOnlyLatestFrame) {
    FrameStore store;
    store.pushFrame(cv::Mat(2, 2, CV_8UC1));
    store.setFrame(cv::Mat(3, 3, CV_8UC1));

    cv::Mat out;
    ASSERT_TRUE(store.waitFrame(out, 10));
    EXPECT_EQ(out.cols, 3);
    EXPECT_FALSE(store.waitFrame(out, 10));
}

TEST(FrameStoreTest, StopWakesWaiterAndDropsNewFrames) {
    FrameStore store;
    std::thread stopper([&store]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        store.stop();
    });

    cv::Mat out;
    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(store.waitFrame(out, 5000));
    EXPECT_LT(std::chrono::steady_clock::now() - t0, std::chrono::seconds(4));
    stopper.join();

    EXPECT_TRUE(store.isStopped());
    store.pushFrame(cv::Mat(2, 2, CV_8UC1));
    EXPECT_EQ(store.sequence(), 0u);
}

TEST(FrameStoreTest, ResetAcceptsFramesAgain) {
    FrameStore store;
    store.pushFrame(cv::Mat(2, 2, CV_8UC1));
    store.stop();
    store.reset();
    EXPECT_FALSE(store.isStopped());

    cv::Mat out;
    EXPECT_FALSE(store.waitFrame(out, 10));   // кадр до reset() не отдаётся
    store.pushFrame(cv::Mat(5, 5, CV_8UC1));
    ASSERT_TRUE(store.waitFrame(out, 10));
    EXPECT_EQ(out.cols, 5);
}

TEST(FrameStoreTest, FrameFromOtherThreadWakesWaiter) {
    FrameStore store;
    std::thread producer([&store]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        store.setFrame(cv::Mat(8, 8, CV_8UC1));
    });

    cv::Mat out;
    EXPECT_TRUE(store.waitFrame(out, 5000));
    producer.join();
    EXPECT_EQ(out.rows, 8);
}
