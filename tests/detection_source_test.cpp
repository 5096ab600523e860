#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

#include "crowd/detect/detection_source.h"
#include "test_helpers.h"

using namespace crowd;
using namespace crowd::detect;

namespace {

// Считает вызовы, по флагу бросает исключение.
class CountingSource : public DetectionSource {
public:
    int calls = 0;
    bool fail = false;

    DetectionBatch detect(const cv::Mat&) override {
        ++calls;
        if (fail) throw std::runtime_error("detector offline");
        DetectionBatch b;
        b.detections.push_back(test::make_det(10.0f * calls, 0, 20, 40));
        return b;
    }
};

} // namespace

TEST(FrameSkippingSourceTest, RunsEveryThirdFrameWithSkipTwo) {
    auto inner = std::make_unique<CountingSource>();
    CountingSource *raw = inner.get();
    FrameSkippingSource src(std::move(inner), 2);
    const cv::Mat frame;

    std::vector<bool> cached;
    for (int i = 0; i < 7; ++i) {
        cached.push_back(src.detect(frame).cached);
    }
    EXPECT_EQ(raw->calls, 3);   // кадры 0, 3, 6
    EXPECT_EQ(cached, (std::vector<bool>{false, true, true, false, true, true, false}));
}

TEST(FrameSkippingSourceTest, CachedBatchRepeatsLastDetections) {
    auto inner = std::make_unique<CountingSource>();
    FrameSkippingSource src(std::move(inner), 1);
    const cv::Mat frame;

    const DetectionBatch first = src.detect(frame);
    const DetectionBatch second = src.detect(frame);
    ASSERT_EQ(second.detections.size(), 1u);
    EXPECT_TRUE(second.cached);
    EXPECT_FLOAT_EQ(second.detections[0].bbox.x, first.detections[0].bbox.x);
}

TEST(FrameSkippingSourceTest, ZeroSkipRunsEveryFrame) {
    auto inner = std::make_unique<CountingSource>();
    CountingSource *raw = inner.get();
    FrameSkippingSource src(std::move(inner), 0);
    const cv::Mat frame;
    for (int i = 0; i < 4; ++i) {
        EXPECT_FALSE(src.detect(frame).cached);
    }
    EXPECT_EQ(raw->calls, 4);
}

TEST(FrameSkippingSourceTest, FailureClearsCacheAndNextFrameRetries) {
    auto inner = std::make_unique<CountingSource>();
    CountingSource *raw = inner.get();
    FrameSkippingSource src(std::move(inner), 2);
    const cv::Mat frame;

    raw->fail = true;
    EXPECT_THROW(src.detect(frame), std::runtime_error);

    raw->fail = false;
    const DetectionBatch retry = src.detect(frame);
    EXPECT_FALSE(retry.cached);
    EXPECT_EQ(raw->calls, 2);
    EXPECT_TRUE(src.detect(frame).cached);
}

TEST(FrameSkippingSourceTest, RejectsNullInner) {
    EXPECT_THROW(FrameSkippingSource(nullptr, 1), std::invalid_argument);
}

TEST(FrameSkippingSourceTest, NegativeSkipIsClamped) {
    FrameSkippingSource src(std::make_unique<CountingSource>(), -3);
    EXPECT_EQ(src.skip_frames(), 0);
    src.set_skip_frames(4);
    EXPECT_EQ(src.skip_frames(), 4);
}

TEST(ReplaySourceTest, ReturnsFramesInOrderWithGaps) {
    std::map<int, std::vector<Detection>> frames;
    frames[0] = {test::make_det(0, 0, 10, 20)};
    frames[2] = {test::make_det(5, 5, 10, 20), test::make_det(50, 5, 10, 20)};

    ReplaySource src(frames);
    EXPECT_EQ(src.frame_count(), 3);

    const cv::Mat frame;
    EXPECT_EQ(src.detect(frame).detections.size(), 1u);
    EXPECT_TRUE(src.detect(frame).detections.empty());
    EXPECT_EQ(src.detect(frame).detections.size(), 2u);
    EXPECT_TRUE(src.detect(frame).detections.empty());
    EXPECT_EQ(src.cursor(), 4);
}

TEST(ReplaySourceTest, EmptyReplay) {
    ReplaySource src(std::map<int, std::vector<Detection>>{});
    EXPECT_EQ(src.frame_count(), 0);
}

TEST(ReplaySourceTest, SkippedFramesAdvanceCursor) {
    std::map<int, std::vector<Detection>> frames;
    frames[2] = {test::make_det(5, 5, 10, 20)};
    ReplaySource src(frames);

    src.frame_skipped();
    src.frame_skipped();
    EXPECT_EQ(src.cursor(), 2);
    EXPECT_EQ(src.detect(cv::Mat()).detections.size(), 1u);
}

TEST(FrameSkippingSourceTest, ReplayStaysAlignedWithFrameIndex) {
    std::map<int, std::vector<Detection>> frames;
    for (int i = 0; i < 6; ++i) frames[i] = {test::make_det(100.0f * i, 0, 40, 80)};
    FrameSkippingSource src(std::make_unique<ReplaySource>(frames), 2);

    // детектор на кадрах 0 и 3, между ними - последний результат
    const std::vector<float> expected_x = {0, 0, 0, 300, 300, 300};
    const cv::Mat frame;
    for (size_t i = 0; i < expected_x.size(); ++i) {
        const DetectionBatch b = src.detect(frame);
        ASSERT_EQ(b.detections.size(), 1u) << "frame " << i;
        EXPECT_FLOAT_EQ(b.detections[0].bbox.x, expected_x[i]) << "frame " << i;
    }
}
