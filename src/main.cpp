#include <opencv2/core.hpp>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include "crowd/config.h"
#include "crowd/detect/detection_io.h"
#include "crowd/detect/detection_source.h"
#include "crowd/pipeline/crowd_pipeline.h"

// Прогон записанных детекций через пайплайн.
// Формат CSV: frame_id,x,y,w,h,confidence[,method]


static void print_summary(const crowd::density::SessionSummary &s, const crowd::AppConfig &cfg) {
    std::cout << std::endl;
    std::cout << "[PIPE] processing complete" << std::endl;
    std::cout << "  frames processed:      " << s.frames_processed << std::endl;
    std::cout << "  average people:        " << s.window.mean_people << std::endl;
    std::cout << "  maximum people:        " << s.window.max_people << std::endl;
    std::cout << "  average groups:        " << s.window.mean_groups << std::endl;
    std::cout << "  maximum groups:        " << s.window.max_groups << std::endl;
    std::cout << "  average density:       " << s.window.mean_density << " people/10k px" << std::endl;
    std::cout << "  max people (session):  " << s.max_people_in_frame << std::endl;
    std::cout << "  stats window:          " << s.window.frames << "/" << cfg.metrics.window_size
              << " frames" << std::endl;
}


int main(int argc, char *argv[]) {

    setvbuf(stdout, nullptr, _IONBF, 0);
    setvbuf(stderr, nullptr, _IONBF, 0);

    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <detections.csv> [config.toml]" << std::endl;
        return 1;
    }

    const std::string detections_path = argv[1];
    const std::string config_path = (argc > 2) ? argv[2] : "config.toml";

    std::cout << "STARTING PIPELINE..." << std::endl;

    // получаем конфигурацию из config.toml (при ошибке - дефолты)
    const crowd::AppConfig cfg = crowd::load_app_config(config_path);

    crowd::detect::CsvLoadResult csv = crowd::detect::load_detections_csv(detections_path);
    if (!csv.opened) {
        return 1;
    }
    if (csv.skipped_lines > 0) {
        std::cerr << "[DET] skipped malformed lines: " << csv.skipped_lines << std::endl;
    }

    auto replay = std::make_unique<crowd::detect::ReplaySource>(std::move(csv.frames));
    const int frame_count = replay->frame_count();
    std::cout << "[DET] frames in file: " << frame_count << std::endl;

    crowd::pipeline::CrowdPipeline pipeline(cfg, std::move(replay));

    // Пикселей нет: размер кадра берётся из [stream].
    const cv::Mat frame;
    for (int i = 0; i < frame_count; ++i) {
        pipeline.process_frame(frame);
    }

    print_summary(pipeline.metrics().summary(), cfg);
    return 0;
}
