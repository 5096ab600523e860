#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include "crowd/config.h"
#include "crowd/density/density_classifier.h"

namespace crowd::density {

struct FrameSample {
    int total_people = 0;
    int group_count = 0;
    float density_score = 0.0f;
};

// Среднее и максимум по окну.
struct WindowStats {
    size_t frames = 0;
    double mean_people = 0.0;
    double mean_groups = 0.0;
    double mean_density = 0.0;
    int max_people = 0;
    int max_groups = 0;
    float max_density = 0.0f;
};

// Итог сессии: счётчики за всё время + статистика текущего окна.
struct SessionSummary {
    std::uint64_t frames_processed = 0;
    std::uint64_t cumulative_people = 0;
    int max_people_in_frame = 0;
    WindowStats window;
};

// Скользящее окно последних кадров, вытеснение строго FIFO.
class MetricsAggregator {
public:
    explicit MetricsAggregator(const MetricsConfig& cfg);

    void push(const FrameSample& sample);
    void push(const DensityMetrics& metrics);

    WindowStats window_stats() const;
    SessionSummary summary() const;

    size_t size() const { return window_.size(); }
    size_t capacity() const { return (size_t)cfg_.window_size; }

    const std::deque<FrameSample>& window() const { return window_; }

    void reset();

    // Уменьшение окна сразу вытесняет самые старые кадры.
    void set_config(const MetricsConfig& cfg);

private:
    MetricsConfig cfg_;
    std::deque<FrameSample> window_;
    std::uint64_t frames_processed_ = 0;
    std::uint64_t cumulative_people_ = 0;
    int max_people_in_frame_ = 0;

    void evict();
};

} // namespace crowd::density
