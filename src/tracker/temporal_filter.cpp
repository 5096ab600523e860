#include "crowd/tracker/temporal_filter.h"
#include "crowd/util/rect_utils.h"

#include <algorithm>
#include <vector>

namespace crowd::tracker {

namespace {
    template <typename T>
    void push_bounded(std::deque<T>& dq, const T& v, int capacity) {
        dq.push_back(v);
        const size_t cap = static_cast<size_t>(std::max(1, capacity));
        while (dq.size() > cap) {
            dq.pop_front();
        }
    }
}

TemporalFilter::TemporalFilter(const SmoothingConfig& cfg) : cfg_(cfg) {}

void TemporalFilter::seed(Track& track, const cv::Rect2f& raw_bbox, float raw_confidence) const {
    track.bbox_history.clear();
    track.confidence_history.clear();
    push_bounded(track.bbox_history, raw_bbox, cfg_.bbox_history);
    push_bounded(track.confidence_history, raw_confidence, cfg_.confidence_history);
}

TemporalFilter::Result TemporalFilter::push(Track& track, const cv::Rect2f& raw_bbox, float raw_confidence) const {
    push_bounded(track.bbox_history, raw_bbox, cfg_.bbox_history);
    push_bounded(track.confidence_history, raw_confidence, cfg_.confidence_history);

    Result r;
    r.bbox = (track.bbox_history.size() > 1) ? weighted_bbox(track.bbox_history) : raw_bbox;
    r.confidence = (track.confidence_history.size() > 1) ? mean_confidence(track.confidence_history)
                                                         : raw_confidence;
    return r;
}

cv::Rect2f TemporalFilter::weighted_bbox(const std::deque<cv::Rect2f>& history) {
    if (history.empty()) return {};
    if (history.size() == 1) return history.front();

    // linspace(0.1, 1.0, n)
    const size_t n = history.size();
    std::vector<double> w(n);
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        w[i] = 0.1 + 0.9 * static_cast<double>(i) / static_cast<double>(n - 1);
        sum += w[i];
    }

    double x = 0.0, y = 0.0, bw = 0.0, bh = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const double k = w[i] / sum;
        x  += history[i].x * k;
        y  += history[i].y * k;
        bw += history[i].width * k;
        bh += history[i].height * k;
    }
    cv::Rect2f r = util::roundRect(cv::Rect2f((float)x, (float)y, (float)bw, (float)bh));
    // не меньше пикселя, иначе трек получит вырожденный bbox
    r.width = std::max(1.0f, r.width);
    r.height = std::max(1.0f, r.height);
    return r;
}

float TemporalFilter::mean_confidence(const std::deque<float>& history) {
    if (history.empty()) return 0.0f;
    double sum = 0.0;
    for (float c : history) sum += c;
    return static_cast<float>(sum / static_cast<double>(history.size()));
}

} // namespace crowd::tracker
