/**
 * @file test_frame_slot.cpp
 * @brief Unit tests for the latest-wins frame slot
 */

#include <gtest/gtest.h>
#include "frame_slot.hpp"

using namespace vcamstudio;

TEST(LatestSlotTest, EmptyUntilFirstPut) {
    LatestSlot<cv::Mat> slot;
    cv::Mat out;

    EXPECT_TRUE(slot.empty());
    EXPECT_FALSE(slot.get(out));
    EXPECT_TRUE(out.empty());
}

TEST(LatestSlotTest, LatestValueWins) {
    LatestSlot<cv::Mat> slot;
    slot.put(cv::Mat(2, 2, CV_8UC1, cv::Scalar(1)));
    slot.put(cv::Mat(2, 2, CV_8UC1, cv::Scalar(2)));
    slot.put(cv::Mat(2, 2, CV_8UC1, cv::Scalar(3)));

    cv::Mat out;
    ASSERT_TRUE(slot.get(out));
    EXPECT_EQ(out.at<uchar>(0, 0), 3);
    EXPECT_EQ(slot.overwritten(), 2u);
}

TEST(LatestSlotTest, ReadDoesNotConsume) {
    LatestSlot<cv::Mat> slot;
    slot.put(cv::Mat(1, 1, CV_8UC1, cv::Scalar(7)));

    cv::Mat a, b;
    EXPECT_TRUE(slot.get(a));
    EXPECT_TRUE(slot.get(b));
    EXPECT_EQ(b.at<uchar>(0, 0), 7);
}

TEST(LatestSlotTest, ReadValueIsIndependentCopy) {
    LatestSlot<cv::Mat> slot;
    slot.put(cv::Mat(2, 2, CV_8UC1, cv::Scalar(10)));

    cv::Mat out;
    ASSERT_TRUE(slot.get(out));
    out.setTo(cv::Scalar(99));

    cv::Mat again;
    ASSERT_TRUE(slot.get(again));
    EXPECT_EQ(again.at<uchar>(1, 1), 10);
}

TEST(LatestSlotTest, OverwriteCountedOnlyWhenUnread) {
    LatestSlot<cv::Mat> slot;
    cv::Mat out;

    slot.put(cv::Mat(1, 1, CV_8UC1));
    slot.get(out);
    slot.put(cv::Mat(1, 1, CV_8UC1));

    EXPECT_EQ(slot.overwritten(), 0u);
}

TEST(LatestSlotTest, ClearEmptiesSlot) {
    LatestSlot<ComposedFrame> slot;
    ComposedFrame f;
    f.frame = cv::Mat(2, 2, CV_8UC3);
    f.frame_id = 4;
    slot.put(f);

    slot.clear();

    ComposedFrame out;
    EXPECT_TRUE(slot.empty());
    EXPECT_FALSE(slot.get(out));
}
