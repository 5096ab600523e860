#pragma once
#include <vector>
#include "crowd/config.h"
#include "crowd/detection.h"

namespace crowd::detect {

    // Boundary filter in front of the tracker.
    // Always drops malformed detections; with quality_filter also drops
    // boxes that do not look like a person (size, aspect ratio and per-method confidence).
    class DetectionValidator {
    public:
        struct Result {
            std::vector<Detection> accepted; // input order preserved
            int rejected = 0;
        };

        explicit DetectionValidator(const DetectionConfig& cfg);

        Result validate(const std::vector<Detection>& dets) const;

        // w > 0, h > 0, finite values, confidence in [0, 1]
        static bool wellFormed(const Detection& d);

        bool qualityOk(const Detection& d) const;

        void set_config(const DetectionConfig& cfg) { cfg_ = cfg; }
        const DetectionConfig& config() const { return cfg_; }

    private:
        DetectionConfig cfg_;
    };

} // namespace crowd::detect
