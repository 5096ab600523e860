#pragma once

#include <opencv2/core.hpp>
#include <vector>
#include "crowd/config.h"
#include "crowd/track.h"

namespace crowd::group {

    struct Group {
        cv::Rect2f bbox;                    // enclosing box of all members, padded, origin clipped at (0,0)
        std::vector<int> member_track_ids;  // in track order
        int count = 0;
        bool is_group = false;              // count > 1
    };

    // Partitions tracks into groups: a pair is joined when the boxes intersect
    // or the centers are within proximity_threshold. O(n^2) pairs per frame,
    // fine for tens of tracks, not for dense-crowd counting.
    class GroupMerger {
    public:
        explicit GroupMerger(const GroupingConfig& cfg, const LoggingConfig& log_cfg = LoggingConfig{});

        // Groups are ordered by their first member in input order.
        std::vector<Group> merge(const std::vector<Track>& tracks) const;

        bool should_merge(const cv::Rect2f& a, const cv::Rect2f& b) const;

        void set_config(const GroupingConfig& cfg) { cfg_ = cfg; }
        void set_logging_config(const LoggingConfig& cfg) { log_cfg_ = cfg; }
        const GroupingConfig& config() const { return cfg_; }

    private:
        GroupingConfig cfg_;
        LoggingConfig log_cfg_;
    };

} // namespace crowd::group
