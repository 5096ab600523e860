#include "crowd/group/group_merger.h"
#include "crowd/group/disjoint_set.h"
#include "crowd/util/rect_utils.h"

#include <iostream>

namespace crowd::group {

    GroupMerger::GroupMerger(const GroupingConfig& cfg, const LoggingConfig& log_cfg)
            : cfg_(cfg), log_cfg_(log_cfg) {}

    bool GroupMerger::should_merge(const cv::Rect2f& a, const cv::Rect2f& b) const {
        const bool overlap = cfg_.touching_counts_as_overlap ? util::touchesOrOverlaps(a, b)
                                                             : util::overlapsStrictly(a, b);
        if (overlap) return true;
        return util::centerDistance(a, b) <= cfg_.proximity_threshold;
    }

    std::vector<Group> GroupMerger::merge(const std::vector<Track>& tracks) const {
        if (tracks.empty()) return {};

        const int n = (int)tracks.size();
        DisjointSet dsu(n);

        // union by overlap/near
        for (int i = 0; i < n; ++i) {
            for (int j = i + 1; j < n; ++j) {
                if (should_merge(tracks[i].bbox, tracks[j].bbox)) dsu.unite(i, j);
            }
        }

        // root -> group index, in order of first appearance
        std::vector<int> group_of_root(n, -1);
        std::vector<Group> out;
        std::vector<cv::Rect2f> raw_union;

        for (int i = 0; i < n; ++i) {
            const int root = dsu.find(i);
            int gi = group_of_root[root];
            if (gi < 0) {
                gi = (int)out.size();
                group_of_root[root] = gi;
                out.emplace_back();
                raw_union.push_back(tracks[i].bbox);
            } else {
                raw_union[gi] = util::unionRect(raw_union[gi], tracks[i].bbox);
            }
            out[gi].member_track_ids.push_back(tracks[i].id);
        }

        for (size_t gi = 0; gi < out.size(); ++gi) {
            Group& g = out[gi];
            g.count = (int)g.member_track_ids.size();
            g.is_group = g.count > 1;
            g.bbox = util::padAndClipOrigin(raw_union[gi], (float)cfg_.padding);
        }

        if (log_cfg_.grouping_level_logger) {
            std::cout << "[GRP] tracks=" << n << " groups=" << out.size() << std::endl;
        }
        return out;
    }

} // namespace crowd::group
