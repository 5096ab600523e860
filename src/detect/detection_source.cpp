#include "crowd/detect/detection_source.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace crowd::detect {

    FrameSkippingSource::FrameSkippingSource(std::unique_ptr<DetectionSource> inner, int skip_frames)
            : inner_(std::move(inner)), skip_frames_(std::max(0, skip_frames)) {
        if (!inner_) {
            throw std::invalid_argument("FrameSkippingSource: inner source is null");
        }
    }

    void FrameSkippingSource::set_skip_frames(int skip_frames) {
        skip_frames_ = std::max(0, skip_frames);
    }

    DetectionBatch FrameSkippingSource::detect(const cv::Mat& frame) {
        const long long n = frame_counter_++;
        const bool run = !has_cache_ || (n % (skip_frames_ + 1)) == 0;

        if (!run) {
            inner_->frame_skipped();
            return DetectionBatch{cache_, true};
        }

        has_cache_ = false;
        cache_.clear();
        DetectionBatch batch = inner_->detect(frame);   // может бросить - кэш уже сброшен
        cache_ = batch.detections;
        has_cache_ = true;
        batch.cached = false;
        return batch;
    }

    ReplaySource::ReplaySource(std::map<int, std::vector<Detection>> frames)
            : frames_(std::move(frames)) {}

    int ReplaySource::frame_count() const {
        if (frames_.empty()) return 0;
        return frames_.rbegin()->first + 1;
    }

    DetectionBatch ReplaySource::detect(const cv::Mat&) {
        DetectionBatch batch;
        auto it = frames_.find(cursor_++);
        if (it != frames_.end()) {
            batch.detections = it->second;
        }
        return batch;
    }

} // namespace crowd::detect
