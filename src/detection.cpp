#include "crowd/detection.h"

#include <cctype>
#include <string>

namespace crowd {

const char *to_string(DetectionMethod method) {
    switch (method) {
        case DetectionMethod::YOLOv8: return "YOLOv8";
        case DetectionMethod::HOG: return "HOG";
        case DetectionMethod::Unknown: break;
    }
    return "Unknown";
}

DetectionMethod method_from_string(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        if (std::isspace(static_cast<unsigned char>(c))) continue;
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "yolov8" || lower == "yolo") return DetectionMethod::YOLOv8;
    if (lower == "hog") return DetectionMethod::HOG;
    return DetectionMethod::Unknown;
}

} // namespace crowd
