#pragma once

#include <opencv2/core.hpp>
#include <deque>
#include "crowd/config.h"
#include "crowd/track.h"

namespace crowd::tracker {

// Сглаживание bbox/confidence трека по короткой истории (2-3 кадра).
//  - bbox: взвешенное среднее, веса растут линейно от старого к новому (0.1 .. 1.0),
//    нормированы на 1, каждая компонента округляется до целого пикселя (w, h не меньше 1);
//  - confidence: обычное среднее по истории;
//  - при истории из одного элемента возвращается сырое наблюдение.
class TemporalFilter {
public:
    struct Result {
        cv::Rect2f bbox;
        float confidence = 0.0f;
    };

    explicit TemporalFilter(const SmoothingConfig& cfg);

    // Добавляет наблюдение в историю трека (с вытеснением старых) и возвращает сглаженные значения.
    Result push(Track& track, const cv::Rect2f& raw_bbox, float raw_confidence) const;

    // Заводит историю нового трека с первым наблюдением.
    void seed(Track& track, const cv::Rect2f& raw_bbox, float raw_confidence) const;

    static cv::Rect2f weighted_bbox(const std::deque<cv::Rect2f>& history);
    static float mean_confidence(const std::deque<float>& history);

    void set_config(const SmoothingConfig& cfg) { cfg_ = cfg; }
    const SmoothingConfig& config() const { return cfg_; }

private:
    SmoothingConfig cfg_;
};

} // namespace crowd::tracker
