#pragma once

#include <opencv2/core.hpp>
#include <map>
#include <memory>
#include <vector>
#include "crowd/detection.h"

namespace crowd::detect {

    struct DetectionBatch {
        std::vector<Detection> detections;
        bool cached = false; // true: detector was not run, previous result is returned
    };

    // Adapter to an external detector (YOLO, HOG, ...).
    // Contract: w > 0, h > 0, confidence in [0, 1]. May throw on detector failure.
    class DetectionSource {
    public:
        virtual ~DetectionSource() = default;

        virtual DetectionBatch detect(const cv::Mat& frame) = 0;

        // Called instead of detect() for a frame the detector is not run on.
        // Sources tied to the frame index (replay) advance here.
        virtual void frame_skipped() {}
    };

    // Runs the wrapped source on the first frame and then every (skip_frames + 1)-th frame;
    // in between returns the cached list with cached = true.
    // A failed call clears the cache so the next frame retries the detector.
    class FrameSkippingSource : public DetectionSource {
    public:
        FrameSkippingSource(std::unique_ptr<DetectionSource> inner, int skip_frames);

        DetectionBatch detect(const cv::Mat& frame) override;

        void set_skip_frames(int skip_frames);
        int skip_frames() const { return skip_frames_; }

    private:
        std::unique_ptr<DetectionSource> inner_;
        int skip_frames_ = 0;
        long long frame_counter_ = 0;
        bool has_cache_ = false;
        std::vector<Detection> cache_;
    };

    // Replays pre-recorded detections: the n-th frame (detect() or frame_skipped()) is frame n (0-based).
    // Frames without entries return an empty list.
    class ReplaySource : public DetectionSource {
    public:
        explicit ReplaySource(std::map<int, std::vector<Detection>> frames);

        DetectionBatch detect(const cv::Mat& frame) override;
        void frame_skipped() override { ++cursor_; }

        // Index of the last recorded frame + 1 (0 if empty).
        int frame_count() const;
        int cursor() const { return cursor_; }

    private:
        std::map<int, std::vector<Detection>> frames_;
        int cursor_ = 0;
    };

} // namespace crowd::detect
