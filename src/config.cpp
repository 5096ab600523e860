#include <toml++/toml.h>   // ДОЛЖНО БЫТЬ ПЕРВЫМ
#include "crowd/config.h"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string_view>


// ============================================================================
// Загрузка config.toml
//
// Важно:
//  - Любая ошибка парсинга не должна "убивать" приложение.
//  - В случае ошибки секция остаётся с дефолтами и загрузчик возвращает false.
//  - Значения читаются во временную структуру, частичная загрузка невозможна.
//  - Все имена ключей должны соответствовать config/config.toml.
// ============================================================================

namespace crowd {

namespace {
    const toml::table &section(const toml::table &tbl, const char *name) {
        const auto *t = tbl[name].as_table();
        if (!t) {
            throw std::runtime_error(std::string("missing [") + name + "] table");
        }
        return *t;
    }
}

bool load_tracker_config(const toml::table &tbl, TrackerConfig &cfg) {
// ---------------------------- [tracker] ---------------------------
    try {
        const auto &t = section(tbl, "tracker");
        TrackerConfig c;
        c.max_disappeared = std::max(0, read_required<int>(t, "max_disappeared"));
        c.max_distance = std::max(0.0f, read_required<float>(t, "max_distance"));
        c.trail_length = std::max(1, read_required<int>(t, "trail_length"));
        cfg = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "tracker config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_smoothing_config(const toml::table &tbl, SmoothingConfig &cfg) {
// --------------------------- [smoothing] --------------------------
    try {
        const auto &t = section(tbl, "smoothing");
        SmoothingConfig c;
        c.bbox_history = std::max(1, read_required<int>(t, "bbox_history"));
        c.confidence_history = std::max(1, read_required<int>(t, "confidence_history"));
        cfg = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "smoothing config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_grouping_config(const toml::table &tbl, GroupingConfig &cfg) {
// ---------------------------- [grouping] --------------------------
    try {
        const auto &t = section(tbl, "grouping");
        GroupingConfig c;
        c.proximity_threshold = std::max(0.0f, read_required<float>(t, "proximity_threshold"));
        c.padding = std::max(0, read_required<int>(t, "padding"));
        c.touching_counts_as_overlap = read_required<bool>(t, "touching_counts_as_overlap");
        cfg = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "grouping config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_density_config(const toml::table &tbl, DensityConfig &cfg) {
// ---------------------------- [density] ---------------------------
    try {
        const auto &t = section(tbl, "density");
        DensityConfig c;
        c.very_low_below = std::max(1, read_required<int>(t, "very_low_below"));
        c.low_below = std::max(c.very_low_below, read_required<int>(t, "low_below"));
        c.medium_below = std::max(c.low_below, read_required<int>(t, "medium_below"));
        c.high_below = std::max(c.medium_below, read_required<int>(t, "high_below"));
        c.grouped_threshold = std::max(1, read_required<int>(t, "grouped_threshold"));
        c.crowd_threshold = std::max(c.grouped_threshold, read_required<int>(t, "crowd_threshold"));
        cfg = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "density config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_metrics_config(const toml::table &tbl, MetricsConfig &cfg) {
// ---------------------------- [metrics] ---------------------------
    try {
        const auto &t = section(tbl, "metrics");
        MetricsConfig c;
        c.window_size = std::max(1, read_required<int>(t, "window_size"));
        cfg = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "metrics config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_detection_config(const toml::table &tbl, DetectionConfig &cfg) {
// --------------------------- [detection] --------------------------
    try {
        const auto &t = section(tbl, "detection");
        DetectionConfig c;
        c.skip_frames = std::max(0, read_required<int>(t, "skip_frames"));
        c.quality_filter = read_required<bool>(t, "quality_filter");
        c.min_width = std::max(0.0f, read_required<float>(t, "min_width"));
        c.min_height = std::max(0.0f, read_required<float>(t, "min_height"));
        c.max_width = std::max(c.min_width, read_required<float>(t, "max_width"));
        c.max_height = std::max(c.min_height, read_required<float>(t, "max_height"));
        c.min_aspect = std::max(0.0f, read_required<float>(t, "min_aspect"));
        c.max_aspect = std::max(c.min_aspect, read_required<float>(t, "max_aspect"));
        c.yolo_min_confidence = std::max(0.0f, std::min(read_required<float>(t, "yolo_min_confidence"), 1.0f));
        c.hog_min_confidence = std::max(0.0f, std::min(read_required<float>(t, "hog_min_confidence"), 1.0f));
        cfg = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "detection config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_stream_config(const toml::table &tbl, StreamConfig &cfg) {
// ----------------------------- [stream] ---------------------------
    try {
        const auto &t = section(tbl, "stream");
        StreamConfig c;
        c.frame_width = std::max(0, read_required<int>(t, "frame_width"));
        c.frame_height = std::max(0, read_required<int>(t, "frame_height"));
        c.wait_frame_ms = std::max(1, read_required<int>(t, "wait_frame_ms"));
        cfg = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "stream config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_logging_config(const toml::table &tbl, LoggingConfig &cfg) {
// ---------------------------- [logging] ---------------------------
    try {
        const auto &t = section(tbl, "logging");
        LoggingConfig c;
        c.tracker_level_logger = read_required<bool>(t, "tracker_level_logger");
        c.grouping_level_logger = read_required<bool>(t, "grouping_level_logger");
        c.density_level_logger = read_required<bool>(t, "density_level_logger");
        c.pipeline_level_logger = read_required<bool>(t, "pipeline_level_logger");
        c.stream_level_logger = read_required<bool>(t, "stream_level_logger");
        cfg = c;
        return true;

    } catch (const std::exception &e) {
        std::cerr << "logging config load failed  " << e.what() << std::endl;
        return false;
    }
}

bool load_app_config(const toml::table &tbl, AppConfig &cfg) {
    bool ok = true;
    ok = load_tracker_config(tbl, cfg.tracker) && ok;
    ok = load_smoothing_config(tbl, cfg.smoothing) && ok;
    ok = load_grouping_config(tbl, cfg.grouping) && ok;
    ok = load_density_config(tbl, cfg.density) && ok;
    ok = load_metrics_config(tbl, cfg.metrics) && ok;
    ok = load_detection_config(tbl, cfg.detection) && ok;
    ok = load_stream_config(tbl, cfg.stream) && ok;
    ok = load_logging_config(tbl, cfg.logging) && ok;

    std::cout << "[CFG] max_disappeared=" << cfg.tracker.max_disappeared
              << " max_distance=" << cfg.tracker.max_distance
              << " bbox_history=" << cfg.smoothing.bbox_history
              << " confidence_history=" << cfg.smoothing.confidence_history
              << " proximity_threshold=" << cfg.grouping.proximity_threshold
              << " padding=" << cfg.grouping.padding
              << " touching_counts_as_overlap=" << (cfg.grouping.touching_counts_as_overlap ? "true" : "false")
              << " grouped_threshold=" << cfg.density.grouped_threshold
              << " crowd_threshold=" << cfg.density.crowd_threshold
              << " window_size=" << cfg.metrics.window_size
              << " skip_frames=" << cfg.detection.skip_frames
              << std::endl;
    return ok;
}

AppConfig load_app_config(const std::string &path) {
    AppConfig cfg;
    try {
        toml::table tbl = toml::parse_file(path);
        load_app_config(tbl, cfg);
    } catch (const toml::parse_error &e) {
        std::cerr << "config parse failed  " << path << ": " << e.description() << std::endl;
    }
    return cfg;
}

} // namespace crowd
