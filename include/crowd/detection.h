#pragma once

#include <opencv2/core.hpp>
#include <string_view>
#include <vector>

namespace crowd {

// Метод, которым получена детекция.
enum class DetectionMethod : int {
    Unknown = 0,
    YOLOv8,
    HOG
};

const char *to_string(DetectionMethod method);

// "YOLOv8" / "HOG" (регистр не важен), всё остальное -> Unknown.
DetectionMethod method_from_string(std::string_view name);

struct Detection {
    cv::Rect2f bbox; // - прямоугольник детекции в координатах кадра (x, y, w, h).
    DetectionMethod method = DetectionMethod::Unknown; // - источник детекции.
    float confidence = 0.0f; // - уверенность детектора, [0, 1].
};

} // namespace crowd
