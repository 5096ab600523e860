#include "crowd/density/density_classifier.h"

#include <algorithm>

namespace crowd::density {

const char *to_string(DensityLevel level) {
    switch (level) {
        case DensityLevel::Empty: return "Empty";
        case DensityLevel::VeryLow: return "Very Low";
        case DensityLevel::Low: return "Low";
        case DensityLevel::Medium: return "Medium";
        case DensityLevel::High: return "High";
        case DensityLevel::VeryHigh: return "Very High";
    }
    return "Empty";
}

DensityClassifier::DensityClassifier(const DensityConfig& cfg) : cfg_(cfg) {}

DensityLevel DensityClassifier::base_level(int total_people) const {
    if (total_people <= 0) return DensityLevel::Empty;
    if (total_people < cfg_.very_low_below) return DensityLevel::VeryLow;
    if (total_people < cfg_.low_below) return DensityLevel::Low;
    if (total_people < cfg_.medium_below) return DensityLevel::Medium;
    if (total_people < cfg_.high_below) return DensityLevel::High;
    return DensityLevel::VeryHigh;
}

DensityLevel DensityClassifier::apply_group_override(DensityLevel base, int largest_group_size) const {
    if (largest_group_size > cfg_.crowd_threshold) {
        return DensityLevel::VeryHigh;
    }
    if (largest_group_size > cfg_.grouped_threshold && base < DensityLevel::VeryHigh) {
        return static_cast<DensityLevel>(static_cast<int>(base) + 1);
    }
    return base;
}

DensityMetrics DensityClassifier::classify(const std::vector<group::Group>& groups,
                                           const cv::Size& frame_size) const {
    DensityMetrics m;
    for (const auto& g : groups) {
        m.total_people += g.count;
        if (g.is_group) m.group_count++;
        else m.individual_count++;
        m.largest_group_size = std::max(m.largest_group_size, g.count);
    }

    const double frame_area = (double)std::max(0, frame_size.width) * (double)std::max(0, frame_size.height);
    if (m.total_people <= 0 || frame_area <= 0.0) {
        // нет людей или вырожденный кадр: без деления
        m.density_level = DensityLevel::Empty;
        m.density_score = 0.0f;
        return m;
    }

    m.density_score = static_cast<float>((double)m.total_people / frame_area * 10000.0);
    m.density_level = apply_group_override(base_level(m.total_people), m.largest_group_size);
    return m;
}

DensityMetrics DensityClassifier::classify(const std::vector<group::Group>& groups,
                                           const std::vector<Track>& tracks,
                                           const cv::Size& frame_size) const {
    DensityMetrics m = classify(groups, frame_size);
    if (tracks.empty()) return m;

    double sum = 0.0;
    float mx = tracks.front().confidence;
    float mn = tracks.front().confidence;
    for (const auto& t : tracks) {
        sum += t.confidence;
        mx = std::max(mx, t.confidence);
        mn = std::min(mn, t.confidence);
    }
    m.avg_confidence = static_cast<float>(sum / (double)tracks.size());
    m.max_confidence = mx;
    m.min_confidence = mn;
    return m;
}

} // namespace crowd::density
