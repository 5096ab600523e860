#pragma once

#include <opencv2/core.hpp>
#include <deque>
#include "crowd/detection.h"

namespace crowd {

struct Track {
    int id = -1; // - идентификатор трека, никогда не переиспользуется.
    cv::Point2f center{0.0f, 0.0f}; // - центр сглаженного bbox.
    cv::Rect2f bbox; // - сглаженный bbox трека.
    float confidence = 0.0f; // - сглаженная уверенность.
    int age = 0; // - сколько раз трек был сопоставлен после создания.
    DetectionMethod method = DetectionMethod::Unknown; // - метод последней сопоставленной детекции.
    int disappeared_count = 0; // - кадров подряд без сопоставления.

    std::deque<cv::Rect2f> bbox_history; // - последние сырые bbox, старые в начале.
    std::deque<float> confidence_history; // - последние сырые confidence.
    std::deque<cv::Point2f> trail; // - траектория центров для отрисовки/аналитики.
};

} // namespace crowd
