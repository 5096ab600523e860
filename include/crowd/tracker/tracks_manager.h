#pragma once

#include <opencv2/core.hpp>
#include <map>
#include <vector>
#include "crowd/config.h"
#include "crowd/detection.h"
#include "crowd/track.h"
#include "crowd/tracker/temporal_filter.h"

namespace crowd::tracker {

/*
  Менеджер треков: сопоставление детекций с треками по расстоянию между центрами,
  создание новых треков, удаление "пропавших".

  Сопоставление жадное: треки упорядочиваются по своему минимальному расстоянию
  до любой детекции (по возрастанию, при равенстве - по id), и каждый трек по очереди
  забирает ближайшую ещё свободную детекцию в пределах max_distance.
  Это не оптимальное назначение (не Hungarian): при конкуренции нескольких треков
  за одну детекцию возможны неоптимальные пары. Принято ради задержки на кадр.
*/
class TracksManager {
public:
    TracksManager(const TrackerConfig& cfg,
                  const SmoothingConfig& smoothing,
                  const LoggingConfig& log_cfg = LoggingConfig{});

    // Сбрасывает все треки. Счётчик id не сбрасывается.
    void reset();

    // Обновляет треки по детекциям кадра.
    // Детекции должны быть валидными (w > 0, h > 0, confidence в [0, 1]),
    // иначе std::invalid_argument и состояние не меняется.
    void update(const std::vector<Detection>& detections);

    // Живые треки, по возрастанию id.
    const std::map<int, Track>& tracks() const { return tracks_; }

    // Копия живых треков по возрастанию id.
    std::vector<Track> snapshot() const;

    // id, который получит следующий новый трек.
    int next_id() const { return next_id_; }

    void set_config(const TrackerConfig& cfg) { cfg_ = cfg; }
    void set_smoothing_config(const SmoothingConfig& cfg) { filter_.set_config(cfg); }
    void set_logging_config(const LoggingConfig& cfg) { log_cfg_ = cfg; }
    const TrackerConfig& config() const { return cfg_; }

    // Проверка контракта детекции (геометрия и диапазон confidence).
    static bool is_valid(const Detection& det);

private:
    struct Match {
        int track_id = -1;
        size_t det_index = 0;
    };

    TrackerConfig cfg_; // - конфигурация трекера.
    TemporalFilter filter_; // - сглаживание bbox/confidence.
    LoggingConfig log_cfg_; // - флаги логирования.
    int next_id_ = 1; // - счётчик id для новых треков (монотонный).
    std::map<int, Track> tracks_; // - хранилище треков: id -> трек.

    // Жадное сопоставление; next - рабочая копия хранилища.
    std::vector<Match> greedy_match(const std::map<int, Track>& next,
                                    const std::vector<Detection>& detections) const;

    void spawn(std::map<int, Track>& next, int& next_id, const Detection& det) const;

    // +1 к disappeared_count, удаление при превышении max_disappeared.
    void mark_missed(std::map<int, Track>& next, int track_id) const;

    void push_trail(Track& t) const;
};

} // namespace crowd::tracker
