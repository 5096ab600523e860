#pragma once

#include <opencv2/core.hpp>
#include <vector>
#include "crowd/config.h"
#include "crowd/group/group_merger.h"
#include "crowd/track.h"

namespace crowd::density {

// Уровни упорядочены по возрастанию тяжести.
enum class DensityLevel : int {
    Empty = 0,
    VeryLow,
    Low,
    Medium,
    High,
    VeryHigh
};

const char *to_string(DensityLevel level);

struct DensityMetrics {
    int total_people = 0; // - сумма count по всем группам.
    int group_count = 0; // - групп с is_group == true.
    int individual_count = 0; // - одиночек (группы из одного трека).
    int largest_group_size = 0; // - размер самой большой группы.
    DensityLevel density_level = DensityLevel::Empty;
    float density_score = 0.0f; // - людей на 10 000 px^2.

    // статистика уверенности по трекам кадра (0, если треков нет)
    float avg_confidence = 0.0f;
    float max_confidence = 0.0f;
    float min_confidence = 0.0f;
};

class DensityClassifier {
public:
    explicit DensityClassifier(const DensityConfig& cfg);

    // Чистая функция: одинаковый вход -> одинаковый выход.
    DensityMetrics classify(const std::vector<group::Group>& groups, const cv::Size& frame_size) const;

    // То же + статистика confidence по трекам.
    DensityMetrics classify(const std::vector<group::Group>& groups,
                            const std::vector<Track>& tracks,
                            const cv::Size& frame_size) const;

    // Уровень только по числу людей, без поправки на группы.
    DensityLevel base_level(int total_people) const;

    // Поправка на крупнейшую группу.
    DensityLevel apply_group_override(DensityLevel base, int largest_group_size) const;

    void set_config(const DensityConfig& cfg) { cfg_ = cfg; }
    const DensityConfig& config() const { return cfg_; }

private:
    DensityConfig cfg_;
};

} // namespace crowd::density
