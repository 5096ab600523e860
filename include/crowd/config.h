#pragma once

#include <toml++/toml.h>   // ОБЯЗАТЕЛЬНО, forward-decl НЕЛЬЗЯ
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace crowd {

template <typename T>
static T read_required(const toml::table &tbl, std::string_view key) {
    const auto *node = tbl.get(key);
    if (!node) {
        throw std::runtime_error("missing key " + std::string(key));
    }
    const auto value = node->value<T>();
    if (!value) {
        throw std::runtime_error("invalid value for " + std::string(key));
    }
    return *value;
}

// ---------------------------- [tracker] ---------------------------
struct TrackerConfig {
    // Допустимое число кадров подряд без сопоставления, после которого трек удаляется.
    int max_disappeared = 15;

    // Gating: максимальное расстояние между центрами трека и детекции (px).
    float max_distance = 80.0f;

    // Длина траектории движения (кол-во центров на трек).
    int trail_length = 30;
};

// --------------------------- [smoothing] --------------------------
struct SmoothingConfig {
    // Окно сглаживания bbox
    int bbox_history = 3;

    // Окно усреднения confidence
    int confidence_history = 2;
};

// ---------------------------- [grouping] --------------------------
struct GroupingConfig {
    // Объединяем треки, если центры ближе этого порога (px)
    float proximity_threshold = 80.0f;

    // Отступ вокруг bbox группы (px)
    int padding = 10;

    // Касание краями считается пересечением
    bool touching_counts_as_overlap = true;
};

// ---------------------------- [density] ---------------------------
// Пороги уровней плотности по total_people (верхняя граница, не включая).
struct DensityConfig {
    int very_low_below = 2;
    int low_below = 5;
    int medium_below = 10;
    int high_below = 20;

    // Группа больше этого размера поднимает уровень на одну ступень
    int grouped_threshold = 5;

    // Группа больше этого размера -> максимальный уровень
    int crowd_threshold = 8;
};

// ---------------------------- [metrics] ---------------------------
struct MetricsConfig {
    // Размер скользящего окна статистики (кадров)
    int window_size = 100;
};

// --------------------------- [detection] --------------------------
struct DetectionConfig {
    // Детектор вызывается раз в (skip_frames + 1) кадров, иначе отдаётся кэш
    int skip_frames = 2;

    // Фильтр "похожести на человека" поверх базовой валидации
    bool quality_filter = true;

    float min_width = 20.0f;
    float min_height = 40.0f;
    float max_width = 300.0f;
    float max_height = 500.0f;

    // Допустимое отношение h / w
    float min_aspect = 1.2f;
    float max_aspect = 4.0f;

    // Минимальная уверенность по методу детекции
    float yolo_min_confidence = 0.5f;
    float hog_min_confidence = 0.7f;
};

// ----------------------------- [stream] ---------------------------
struct StreamConfig {
    // Размер кадра, если пиксели кадра недоступны
    int frame_width = 768;
    int frame_height = 576;

    // Сколько ждать новый кадр в рабочем потоке (мс)
    int wait_frame_ms = 100;
};

// ---------------------------- [logging] ---------------------------
struct LoggingConfig {
    bool tracker_level_logger = false;
    bool grouping_level_logger = false;
    bool density_level_logger = true;
    bool pipeline_level_logger = true;
    bool stream_level_logger = true;
};

struct AppConfig {
    TrackerConfig tracker;
    SmoothingConfig smoothing;
    GroupingConfig grouping;
    DensityConfig density;
    MetricsConfig metrics;
    DetectionConfig detection;
    StreamConfig stream;
    LoggingConfig logging;
};

// Каждый загрузчик: при ошибке оставляет дефолты, пишет в std::cerr и возвращает false.
bool load_tracker_config(const toml::table &tbl, TrackerConfig &cfg);
bool load_smoothing_config(const toml::table &tbl, SmoothingConfig &cfg);
bool load_grouping_config(const toml::table &tbl, GroupingConfig &cfg);
bool load_density_config(const toml::table &tbl, DensityConfig &cfg);
bool load_metrics_config(const toml::table &tbl, MetricsConfig &cfg);
bool load_detection_config(const toml::table &tbl, DetectionConfig &cfg);
bool load_stream_config(const toml::table &tbl, StreamConfig &cfg);
bool load_logging_config(const toml::table &tbl, LoggingConfig &cfg);

// Загружает все секции. Возвращает false, если хотя бы одна секция не загрузилась.
bool load_app_config(const toml::table &tbl, AppConfig &cfg);

// Парсит файл; при ошибке парсинга возвращает дефолтную конфигурацию.
AppConfig load_app_config(const std::string &path);

} // namespace crowd
