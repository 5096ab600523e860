#pragma once

#include <opencv2/core.hpp>
#include <cstdint>
#include <memory>
#include <vector>
#include "crowd/config.h"
#include "crowd/density/density_classifier.h"
#include "crowd/density/metrics_aggregator.h"
#include "crowd/detect/detection_source.h"
#include "crowd/detect/detection_validator.h"
#include "crowd/group/group_merger.h"
#include "crowd/track.h"
#include "crowd/tracker/tracks_manager.h"

namespace crowd::pipeline {

// Результат одного кадра для отрисовки / стриминга / экспорта статистики.
struct FrameResult {
    std::uint64_t frame_index = 0; // - порядковый номер кадра в пайплайне.
    bool detections_cached = false; // - детектор не запускался, использован прошлый результат.
    bool detector_failed = false; // - детектор упал, кадр обработан как "без детекций".
    int rejected_detections = 0; // - отброшено валидатором.
    std::vector<Track> tracks; // - живые треки по возрастанию id.
    std::vector<group::Group> groups;
    density::DensityMetrics metrics;
};

/*
  Покадровый пайплайн одного стрима:
    детектор -> валидатор -> трекер (+сглаживание) -> группы -> плотность -> метрики.

  Однопоточный: один экземпляр на одну камеру, общего состояния между экземплярами нет.
  Ошибка детектора не останавливает трекинг: кадр считается пустым, треки стареют.
*/
class CrowdPipeline {
public:
    // source может быть nullptr, если кадры подаются через process_detections().
    CrowdPipeline(const AppConfig& cfg, std::unique_ptr<detect::DetectionSource> source);
    CrowdPipeline(const toml::table& tbl, std::unique_ptr<detect::DetectionSource> source);

    // Полный цикл кадра с вызовом детектора. Пустой frame -> размер из [stream].
    FrameResult process_frame(const cv::Mat& frame);

    // Цикл кадра для уже полученных детекций.
    FrameResult process_detections(const detect::DetectionBatch& batch, const cv::Size& frame_size);

    // Применить новую конфигурацию без потери треков и окна метрик.
    void apply_config(const AppConfig& cfg);

    // Перечитать конфигурацию из TOML. Секции с ошибкой остаются прежними.
    bool reload(const toml::table& tbl);

    // Сброс треков и метрик (id продолжают расти).
    void reset();

    const AppConfig& config() const { return cfg_; }
    const tracker::TracksManager& tracker() const { return tracker_; }
    const density::MetricsAggregator& metrics() const { return metrics_; }
    std::uint64_t frames_processed() const { return frame_index_; }

private:
    AppConfig cfg_;
    std::unique_ptr<detect::DetectionSource> source_;
    detect::FrameSkippingSource *skipper_ = nullptr; // - принадлежит source_.
    detect::DetectionValidator validator_;
    tracker::TracksManager tracker_;
    group::GroupMerger merger_;
    density::DensityClassifier classifier_;
    density::MetricsAggregator metrics_;
    std::uint64_t frame_index_ = 0;

    cv::Size fallback_frame_size() const;
};

} // namespace crowd::pipeline
