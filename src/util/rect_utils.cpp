#include "crowd/util/rect_utils.h"
#include <algorithm>
#include <cmath>

namespace crowd::util {

cv::Point2f centerOf(const cv::Rect2f& r) {
    return { r.x + r.width*0.5f, r.y + r.height*0.5f };
}

float distance(const cv::Point2f& a, const cv::Point2f& b) {
    float dx = a.x - b.x;
    float dy = a.y - b.y;
    return std::sqrt(dx*dx + dy*dy);
}

float centerDistance(const cv::Rect2f& a, const cv::Rect2f& b) {
    return distance(centerOf(a), centerOf(b));
}

bool touchesOrOverlaps(const cv::Rect2f& a, const cv::Rect2f& b) {
    const float ax2 = a.x + a.width;
    const float ay2 = a.y + a.height;
    const float bx2 = b.x + b.width;
    const float by2 = b.y + b.height;
    return !(ax2 < b.x || bx2 < a.x || ay2 < b.y || by2 < a.y);
}

bool overlapsStrictly(const cv::Rect2f& a, const cv::Rect2f& b) {
    const float iw = std::min(a.x + a.width,  b.x + b.width)  - std::max(a.x, b.x);
    const float ih = std::min(a.y + a.height, b.y + b.height) - std::max(a.y, b.y);
    return iw > 0.f && ih > 0.f;
}

cv::Rect2f unionRect(const cv::Rect2f& a, const cv::Rect2f& b) {
    float x1 = std::min(a.x, b.x);
    float y1 = std::min(a.y, b.y);
    float x2 = std::max(a.x + a.width,  b.x + b.width);
    float y2 = std::max(a.y + a.height, b.y + b.height);
    return cv::Rect2f(x1, y1, x2-x1, y2-y1);
}

cv::Rect2f padAndClipOrigin(const cv::Rect2f& r, float pad) {
    float x1 = std::max(0.0f, r.x - pad);
    float y1 = std::max(0.0f, r.y - pad);
    float x2 = r.x + r.width  + pad;
    float y2 = r.y + r.height + pad;
    return cv::Rect2f(x1, y1, std::max(0.0f, x2-x1), std::max(0.0f, y2-y1));
}

cv::Rect2f roundRect(const cv::Rect2f& r) {
    return cv::Rect2f(std::round(r.x), std::round(r.y), std::round(r.width), std::round(r.height));
}

} // namespace crowd::util
