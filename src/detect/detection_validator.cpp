#include "crowd/detect/detection_validator.h"
#include "crowd/tracker/tracks_manager.h"

namespace crowd::detect {

    DetectionValidator::DetectionValidator(const DetectionConfig& cfg) : cfg_(cfg) {}

    bool DetectionValidator::wellFormed(const Detection& d) {
        return tracker::TracksManager::is_valid(d);
    }

    bool DetectionValidator::qualityOk(const Detection& d) const {
        const cv::Rect2f& r = d.bbox;

        if (r.width  < cfg_.min_width  || r.height < cfg_.min_height) return false;
        if (r.width  > cfg_.max_width  || r.height > cfg_.max_height) return false;

        // person-like aspect ratio (h / w)
        const float ar = r.height / r.width;
        if (ar < cfg_.min_aspect || ar > cfg_.max_aspect) return false;

        switch (d.method) {
            case DetectionMethod::YOLOv8:
                return d.confidence >= cfg_.yolo_min_confidence;
            case DetectionMethod::HOG:
                return d.confidence >= cfg_.hog_min_confidence;
            case DetectionMethod::Unknown:
                break;
        }
        return true;
    }

    DetectionValidator::Result DetectionValidator::validate(const std::vector<Detection>& dets) const {
        Result res;
        res.accepted.reserve(dets.size());

        for (const auto& d : dets) {
            if (!wellFormed(d) || (cfg_.quality_filter && !qualityOk(d))) {
                res.rejected++;
                continue;
            }
            res.accepted.push_back(d);
        }
        return res;
    }

} // namespace crowd::detect
