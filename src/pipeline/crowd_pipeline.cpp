#include "crowd/pipeline/crowd_pipeline.h"

#include <iostream>
#include <utility>

namespace crowd::pipeline {

namespace {
    AppConfig config_from_table(const toml::table& tbl) {
        AppConfig cfg;
        load_app_config(tbl, cfg);
        return cfg;
    }
}

CrowdPipeline::CrowdPipeline(const AppConfig& cfg, std::unique_ptr<detect::DetectionSource> source)
        : cfg_(cfg),
          validator_(cfg.detection),
          tracker_(cfg.tracker, cfg.smoothing, cfg.logging),
          merger_(cfg.grouping, cfg.logging),
          classifier_(cfg.density),
          metrics_(cfg.metrics) {
    if (source) {
        auto skipping = std::make_unique<detect::FrameSkippingSource>(std::move(source), cfg_.detection.skip_frames);
        skipper_ = skipping.get();
        source_ = std::move(skipping);
    }
}

CrowdPipeline::CrowdPipeline(const toml::table& tbl, std::unique_ptr<detect::DetectionSource> source)
        : CrowdPipeline(config_from_table(tbl), std::move(source)) {}

cv::Size CrowdPipeline::fallback_frame_size() const {
    return cv::Size(cfg_.stream.frame_width, cfg_.stream.frame_height);
}

FrameResult CrowdPipeline::process_frame(const cv::Mat& frame) {
    detect::DetectionBatch batch;
    bool failed = false;

    if (!source_) {
        failed = true;
        std::cerr << "[PIPE] no detection source, frame treated as empty" << std::endl;
    } else {
        try {
            batch = source_->detect(frame);
        } catch (const std::exception& e) {
            // деградация до "нет детекций", трекинг продолжается
            std::cerr << "[PIPE] detector failed: " << e.what() << std::endl;
            batch = detect::DetectionBatch{};
            failed = true;
        }
    }

    FrameResult r = process_detections(batch, frame.empty() ? fallback_frame_size() : frame.size());
    r.detector_failed = failed;
    return r;
}

FrameResult CrowdPipeline::process_detections(const detect::DetectionBatch& batch, const cv::Size& frame_size) {
    detect::DetectionValidator::Result valid = validator_.validate(batch.detections);
    if (valid.rejected > 0 && cfg_.logging.pipeline_level_logger) {
        std::cout << "[DET] rejected=" << valid.rejected
                  << " accepted=" << valid.accepted.size()
                  << std::endl;
    }

    // валидатор гарантирует контракт трекера, исключения здесь не ожидаются
    tracker_.update(valid.accepted);

    FrameResult r;
    r.frame_index = frame_index_++;
    r.detections_cached = batch.cached;
    r.rejected_detections = valid.rejected;
    r.tracks = tracker_.snapshot();
    r.groups = merger_.merge(r.tracks);
    r.metrics = classifier_.classify(r.groups, r.tracks, frame_size);
    metrics_.push(r.metrics);

    if (cfg_.logging.density_level_logger) {
        std::cout << "[DENS] frame=" << r.frame_index
                  << " people=" << r.metrics.total_people
                  << " groups=" << r.metrics.group_count
                  << " individuals=" << r.metrics.individual_count
                  << " largest=" << r.metrics.largest_group_size
                  << " level=" << density::to_string(r.metrics.density_level)
                  << " score=" << r.metrics.density_score
                  << (r.detections_cached ? " (cached)" : "")
                  << std::endl;
    }
    return r;
}

void CrowdPipeline::apply_config(const AppConfig& cfg) {
    cfg_ = cfg;
    if (skipper_) skipper_->set_skip_frames(cfg.detection.skip_frames);
    validator_.set_config(cfg.detection);
    tracker_.set_config(cfg.tracker);
    tracker_.set_smoothing_config(cfg.smoothing);
    tracker_.set_logging_config(cfg.logging);
    merger_.set_config(cfg.grouping);
    merger_.set_logging_config(cfg.logging);
    classifier_.set_config(cfg.density);
    metrics_.set_config(cfg.metrics);
}

bool CrowdPipeline::reload(const toml::table& tbl) {
    AppConfig next = cfg_;
    const bool ok = load_app_config(tbl, next);
    apply_config(next);
    if (cfg_.logging.pipeline_level_logger) {
        std::cout << "[PIPE] config reloaded" << (ok ? "" : " (with errors, see above)") << std::endl;
    }
    return ok;
}

void CrowdPipeline::reset() {
    tracker_.reset();
    metrics_.reset();
}

} // namespace crowd::pipeline
