#include <gtest/gtest.h>
#include <toml++/toml.h>
#include <string>

#include "crowd/config.h"

using namespace crowd;

namespace {

const char *kFullConfig = R"(
[tracker]
max_disappeared = 7
max_distance = 55.5
trail_length = 12

[smoothing]
bbox_history = 2
confidence_history = 3

[grouping]
proximity_threshold = 40.0
padding = 4
touching_counts_as_overlap = false

[density]
very_low_below = 3
low_below = 6
medium_below = 11
high_below = 21
grouped_threshold = 4
crowd_threshold = 7

[metrics]
window_size = 50

[detection]
skip_frames = 1
quality_filter = false
min_width = 10.0
min_height = 20.0
max_width = 200.0
max_height = 400.0
min_aspect = 1.0
max_aspect = 5.0
yolo_min_confidence = 0.4
hog_min_confidence = 0.6

[stream]
frame_width = 640
frame_height = 480
wait_frame_ms = 50

[logging]
tracker_level_logger = true
grouping_level_logger = true
density_level_logger = false
pipeline_level_logger = false
stream_level_logger = false
)";

} // namespace

TEST(ConfigTest, LoadsEverySection) {
    toml::table tbl = toml::parse(kFullConfig);
    AppConfig cfg;
    EXPECT_TRUE(load_app_config(tbl, cfg));

    EXPECT_EQ(cfg.tracker.max_disappeared, 7);
    EXPECT_FLOAT_EQ(cfg.tracker.max_distance, 55.5f);
    EXPECT_EQ(cfg.tracker.trail_length, 12);
    EXPECT_EQ(cfg.smoothing.bbox_history, 2);
    EXPECT_EQ(cfg.smoothing.confidence_history, 3);
    EXPECT_FLOAT_EQ(cfg.grouping.proximity_threshold, 40.0f);
    EXPECT_EQ(cfg.grouping.padding, 4);
    EXPECT_FALSE(cfg.grouping.touching_counts_as_overlap);
    EXPECT_EQ(cfg.density.very_low_below, 3);
    EXPECT_EQ(cfg.density.high_below, 21);
    EXPECT_EQ(cfg.density.grouped_threshold, 4);
    EXPECT_EQ(cfg.density.crowd_threshold, 7);
    EXPECT_EQ(cfg.metrics.window_size, 50);
    EXPECT_EQ(cfg.detection.skip_frames, 1);
    EXPECT_FALSE(cfg.detection.quality_filter);
    EXPECT_FLOAT_EQ(cfg.detection.hog_min_confidence, 0.6f);
    EXPECT_EQ(cfg.stream.frame_width, 640);
    EXPECT_EQ(cfg.stream.wait_frame_ms, 50);
    EXPECT_TRUE(cfg.logging.tracker_level_logger);
    EXPECT_FALSE(cfg.logging.stream_level_logger);
}

TEST(ConfigTest, MissingSectionKeepsDefaults) {
    toml::table tbl = toml::parse("[metrics]\nwindow_size = 10\n");
    TrackerConfig tracker;
    EXPECT_FALSE(load_tracker_config(tbl, tracker));
    EXPECT_EQ(tracker.max_disappeared, 15);
    EXPECT_FLOAT_EQ(tracker.max_distance, 80.0f);

    MetricsConfig metrics;
    EXPECT_TRUE(load_metrics_config(tbl, metrics));
    EXPECT_EQ(metrics.window_size, 10);
}

TEST(ConfigTest, MistypedKeyLeavesSectionUntouched) {
    toml::table tbl = toml::parse(R"(
[tracker]
max_disappeared = 3
max_distance = "far"
trail_length = 5
)");
    TrackerConfig tracker;
    EXPECT_FALSE(load_tracker_config(tbl, tracker));
    // ни одно поле не применилось частично
    EXPECT_EQ(tracker.max_disappeared, 15);
    EXPECT_EQ(tracker.trail_length, 30);
}

TEST(ConfigTest, MissingKeyFailsSection) {
    toml::table tbl = toml::parse("[smoothing]\nbbox_history = 4\n");
    SmoothingConfig smoothing;
    EXPECT_FALSE(load_smoothing_config(tbl, smoothing));
    EXPECT_EQ(smoothing.bbox_history, 3);
}

TEST(ConfigTest, OutOfRangeValuesAreClamped) {
    toml::table tbl = toml::parse(R"(
[smoothing]
bbox_history = 0
confidence_history = -2

[metrics]
window_size = 0
)");
    SmoothingConfig smoothing;
    EXPECT_TRUE(load_smoothing_config(tbl, smoothing));
    EXPECT_EQ(smoothing.bbox_history, 1);
    EXPECT_EQ(smoothing.confidence_history, 1);

    MetricsConfig metrics;
    EXPECT_TRUE(load_metrics_config(tbl, metrics));
    EXPECT_EQ(metrics.window_size, 1);
}

TEST(ConfigTest, ReadRequiredThrowsOnMissingKey) {
    toml::table tbl = toml::parse("a = 1\n");
    EXPECT_EQ(read_required<int>(tbl, "a"), 1);
    EXPECT_THROW(read_required<int>(tbl, "b"), std::runtime_error);
    EXPECT_THROW(read_required<std::string>(tbl, "a"), std::runtime_error);
}

TEST(ConfigTest, ShippedConfigFileLoads) {
    const AppConfig cfg = load_app_config(std::string(CROWD_TEST_CONFIG));
    EXPECT_EQ(cfg.tracker.max_disappeared, 15);
    EXPECT_FLOAT_EQ(cfg.tracker.max_distance, 80.0f);
    EXPECT_EQ(cfg.smoothing.bbox_history, 3);
    EXPECT_EQ(cfg.smoothing.confidence_history, 2);
    EXPECT_EQ(cfg.grouping.padding, 10);
    EXPECT_TRUE(cfg.grouping.touching_counts_as_overlap);
    EXPECT_EQ(cfg.density.crowd_threshold, 8);
    EXPECT_EQ(cfg.density.grouped_threshold, 5);
    EXPECT_EQ(cfg.metrics.window_size, 100);
    EXPECT_EQ(cfg.stream.frame_width, 768);
    EXPECT_EQ(cfg.stream.frame_height, 576);
}

TEST(ConfigTest, UnreadableFileGivesDefaults) {
    const AppConfig cfg = load_app_config(std::string("/nonexistent/crowd/config.toml"));
    EXPECT_EQ(cfg.tracker.max_disappeared, 15);
    EXPECT_EQ(cfg.metrics.window_size, 100);
}
