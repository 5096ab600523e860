#include "crowd/density/metrics_aggregator.h"

#include <algorithm>

namespace crowd::density {

MetricsAggregator::MetricsAggregator(const MetricsConfig& cfg) : cfg_(cfg) {
    cfg_.window_size = std::max(1, cfg_.window_size);
}

void MetricsAggregator::evict() {
    while (window_.size() > (size_t)cfg_.window_size) {
        window_.pop_front();
    }
}

void MetricsAggregator::push(const FrameSample& sample) {
    window_.push_back(sample);
    evict();

    frames_processed_++;
    cumulative_people_ += (std::uint64_t)std::max(0, sample.total_people);
    max_people_in_frame_ = std::max(max_people_in_frame_, sample.total_people);
}

void MetricsAggregator::push(const DensityMetrics& metrics) {
    push(FrameSample{metrics.total_people, metrics.group_count, metrics.density_score});
}

WindowStats MetricsAggregator::window_stats() const {
    WindowStats s;
    s.frames = window_.size();
    if (window_.empty()) return s;

    double people = 0.0, groups = 0.0, density = 0.0;
    s.max_people = window_.front().total_people;
    s.max_groups = window_.front().group_count;
    s.max_density = window_.front().density_score;
    for (const auto& f : window_) {
        people += f.total_people;
        groups += f.group_count;
        density += f.density_score;
        s.max_people = std::max(s.max_people, f.total_people);
        s.max_groups = std::max(s.max_groups, f.group_count);
        s.max_density = std::max(s.max_density, f.density_score);
    }
    const double n = (double)window_.size();
    s.mean_people = people / n;
    s.mean_groups = groups / n;
    s.mean_density = density / n;
    return s;
}

SessionSummary MetricsAggregator::summary() const {
    SessionSummary s;
    s.frames_processed = frames_processed_;
    s.cumulative_people = cumulative_people_;
    s.max_people_in_frame = max_people_in_frame_;
    s.window = window_stats();
    return s;
}

void MetricsAggregator::reset() {
    window_.clear();
    frames_processed_ = 0;
    cumulative_people_ = 0;
    max_people_in_frame_ = 0;
}

void MetricsAggregator::set_config(const MetricsConfig& cfg) {
    cfg_ = cfg;
    cfg_.window_size = std::max(1, cfg_.window_size);
    evict();
}

} // namespace crowd::density
