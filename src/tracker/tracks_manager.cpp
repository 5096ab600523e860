#include "crowd/tracker/tracks_manager.h"
#include "crowd/util/rect_utils.h"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

/*
  Менеджер треков, отвечает за треки (ассоциация по центрам, disappeared_count).

  Порядок обработки кадра в update():
  1) валидация детекций (исключение до любых изменений);
  2) работа идёт над копией хранилища, в конце - swap. Снаружи видно
     либо состояние до кадра, либо после, промежуточного нет;
  3) три ветки: нет детекций / нет треков / общий случай с матрицей расстояний;
  4) траектории обновляются для всех выживших треков.
*/

namespace crowd::tracker {

TracksManager::TracksManager(const TrackerConfig& cfg,
                             const SmoothingConfig& smoothing,
                             const LoggingConfig& log_cfg)
        : cfg_(cfg), filter_(smoothing), log_cfg_(log_cfg) {}

void TracksManager::reset() {
    tracks_.clear();
}

bool TracksManager::is_valid(const Detection& det) {
    const cv::Rect2f& r = det.bbox;
    if (!std::isfinite(r.x) || !std::isfinite(r.y) ||
        !std::isfinite(r.width) || !std::isfinite(r.height)) return false;
    if (r.width <= 0.f || r.height <= 0.f) return false;
    if (!std::isfinite(det.confidence)) return false;
    return det.confidence >= 0.f && det.confidence <= 1.f;
}

std::vector<Track> TracksManager::snapshot() const {
    std::vector<Track> out;
    out.reserve(tracks_.size());
    for (const auto& kv : tracks_) {
        out.push_back(kv.second);
    }
    return out;
}

void TracksManager::push_trail(Track& t) const {
    t.trail.push_back(t.center);
    while ((int)t.trail.size() > std::max(1, cfg_.trail_length)) {
        t.trail.pop_front();
    }
}

void TracksManager::spawn(std::map<int, Track>& next, int& next_id, const Detection& det) const {
    Track t;
    t.id = next_id++;
    t.bbox = det.bbox;
    t.center = util::centerOf(det.bbox);
    t.confidence = det.confidence;
    t.method = det.method;
    t.age = 0;
    t.disappeared_count = 0;
    filter_.seed(t, det.bbox, det.confidence);
    next.emplace(t.id, std::move(t));
}

void TracksManager::mark_missed(std::map<int, Track>& next, int track_id) const {
    auto it = next.find(track_id);
    if (it == next.end()) return;
    it->second.disappeared_count++;
    if (it->second.disappeared_count > cfg_.max_disappeared) {
        if (log_cfg_.tracker_level_logger) {
            std::cout << "[TRK] drop id=" << track_id
                      << " disappeared=" << it->second.disappeared_count
                      << std::endl;
        }
        next.erase(it);
    }
}

std::vector<TracksManager::Match>
TracksManager::greedy_match(const std::map<int, Track>& next,
                            const std::vector<Detection>& detections) const {
    std::vector<int> ids;
    std::vector<cv::Point2f> track_centers;
    ids.reserve(next.size());
    track_centers.reserve(next.size());
    for (const auto& kv : next) {
        ids.push_back(kv.first);
        track_centers.push_back(kv.second.center);
    }

    const size_t nt = ids.size();
    const size_t nd = detections.size();

    std::vector<cv::Point2f> det_centers(nd);
    for (size_t di = 0; di < nd; ++di) {
        det_centers[di] = util::centerOf(detections[di].bbox);
    }

    // Полная матрица расстояний трек x детекция + минимум по строке.
    std::vector<float> dist(nt * nd);
    std::vector<float> row_min(nt, std::numeric_limits<float>::infinity());
    for (size_t ti = 0; ti < nt; ++ti) {
        for (size_t di = 0; di < nd; ++di) {
            const float d = util::distance(track_centers[ti], det_centers[di]);
            dist[ti * nd + di] = d;
            row_min[ti] = std::min(row_min[ti], d);
        }
    }

    std::vector<size_t> order(nt);
    std::iota(order.begin(), order.end(), size_t{0});
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return row_min[a] < row_min[b]; });

    std::vector<char> det_used(nd, 0);
    std::vector<Match> matches;
    matches.reserve(std::min(nt, nd));

    for (size_t ti : order) {
        float best = std::numeric_limits<float>::infinity();
        int best_di = -1;

        for (size_t di = 0; di < nd; ++di) {
            if (det_used[di]) continue;
            const float d = dist[ti * nd + di];
            if (d < best) { best = d; best_di = (int)di; }
        }

        if (best_di != -1 && best <= cfg_.max_distance) {
            det_used[(size_t)best_di] = 1;
            matches.push_back(Match{ids[ti], (size_t)best_di});
        }
    }
    return matches;
}

void TracksManager::update(const std::vector<Detection>& detections) {
    for (size_t i = 0; i < detections.size(); ++i) {
        if (!is_valid(detections[i])) {
            throw std::invalid_argument("invalid detection at index " + std::to_string(i));
        }
    }

    std::map<int, Track> next = tracks_;
    int next_id = next_id_;
    size_t matched = 0;
    size_t spawned = 0;

    if (detections.empty()) {
        std::vector<int> ids;
        ids.reserve(next.size());
        for (const auto& kv : next) ids.push_back(kv.first);
        for (int id : ids) mark_missed(next, id);

    } else if (next.empty()) {
        for (const auto& det : detections) {
            spawn(next, next_id, det);
            spawned++;
        }

    } else {
        const std::vector<Match> matches = greedy_match(next, detections);

        std::vector<char> det_used(detections.size(), 0);
        std::vector<int> unmatched_ids;

        for (const auto& m : matches) {
            Track& t = next.at(m.track_id);
            const Detection& det = detections[m.det_index];

            const TemporalFilter::Result smoothed = filter_.push(t, det.bbox, det.confidence);
            t.bbox = smoothed.bbox;
            t.confidence = smoothed.confidence;
            t.center = util::centerOf(smoothed.bbox);
            t.method = det.method;
            t.age++;
            t.disappeared_count = 0;

            det_used[m.det_index] = 1;
        }
        matched = matches.size();

        for (const auto& kv : next) {
            const bool was_matched = std::any_of(matches.begin(), matches.end(),
                                                 [&](const Match& m) { return m.track_id == kv.first; });
            if (!was_matched) unmatched_ids.push_back(kv.first);
        }
        for (int id : unmatched_ids) mark_missed(next, id);

        for (size_t di = 0; di < detections.size(); ++di) {
            if (det_used[di]) continue;
            spawn(next, next_id, detections[di]);
            spawned++;
        }
    }

    for (auto& kv : next) {
        push_trail(kv.second);
    }

    if (log_cfg_.tracker_level_logger) {
        std::cout << "[TRK] update: detections=" << detections.size()
                  << " tracks_before=" << tracks_.size()
                  << " matched=" << matched
                  << " spawned=" << spawned
                  << " tracks_after=" << next.size()
                  << std::endl;
    }

    tracks_.swap(next);
    next_id_ = next_id;
}

} // namespace crowd::tracker
