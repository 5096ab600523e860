#pragma once
#include <opencv2/core.hpp>

namespace crowd::util {

// Center of a rectangle in floating point.
cv::Point2f centerOf(const cv::Rect2f& r);

// Euclidean distance between two points (pixels).
float distance(const cv::Point2f& a, const cv::Point2f& b);

// Euclidean distance between centers (pixels).
float centerDistance(const cv::Rect2f& a, const cv::Rect2f& b);

// Closed-interval intersection test: rectangles sharing only an edge or a corner intersect.
bool touchesOrOverlaps(const cv::Rect2f& a, const cv::Rect2f& b);

// Strict test: intersection must have positive area.
bool overlapsStrictly(const cv::Rect2f& a, const cv::Rect2f& b);

// Smallest rectangle containing both.
cv::Rect2f unionRect(const cv::Rect2f& a, const cv::Rect2f& b);

// Expand by pad on every side, then clip top-left to (0, 0). Right/bottom edges are kept.
cv::Rect2f padAndClipOrigin(const cv::Rect2f& r, float pad);

// Round each component to the nearest integer pixel.
cv::Rect2f roundRect(const cv::Rect2f& r);

} // namespace crowd::util
