#include "crowd/pipeline/stream_worker.h"

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace crowd::pipeline {

const char *to_string(StartResult r) {
    return r == StartResult::Started ? "started" : "already_running";
}

const char *to_string(StopResult r) {
    return r == StopResult::Stopped ? "stopped" : "not_running";
}

StreamWorker::StreamWorker(std::string name,
                           core::FrameStore& frames,
                           std::unique_ptr<CrowdPipeline> pipeline)
        : name_(std::move(name)), frames_(frames), pipeline_(std::move(pipeline)) {
    if (!pipeline_) {
        throw std::invalid_argument("StreamWorker: pipeline is null");
    }
}

StreamWorker::~StreamWorker() {
    stop();
}

StartResult StreamWorker::start() {
    // Из sink (рабочий поток) перезапуск невозможен: поток ещё жив.
    if (std::this_thread::get_id() == worker_id_.load()) {
        return StartResult::AlreadyRunning;
    }

    std::lock_guard<std::mutex> lk(control_mu_);

    // Уже запущено: ничего не делаем.
    if (running_.load(std::memory_order_acquire)) {
        if (pipeline_->config().logging.stream_level_logger) {
            std::cout << "[STREAM] " << name_ << ": start ignored, already running" << std::endl;
        }
        return StartResult::AlreadyRunning;
    }

    // поток, остановленный из sink, ещё не присоединён
    if (th_.joinable()) {
        th_.join();
        worker_id_.store(std::thread::id());
    }

    running_.store(true, std::memory_order_release);
    th_ = std::thread(&StreamWorker::threadMain, this);
    if (pipeline_->config().logging.stream_level_logger) {
        std::cout << "[STREAM] " << name_ << ": started" << std::endl;
    }
    return StartResult::Started;
}

StopResult StreamWorker::stop() {
    // Вызов из sink: только снимаем флаг, join сделает следующий stop()/start() или деструктор.
    if (std::this_thread::get_id() == worker_id_.load()) {
        return running_.exchange(false, std::memory_order_acq_rel) ? StopResult::Stopped
                                                                   : StopResult::NotRunning;
    }

    std::lock_guard<std::mutex> lk(control_mu_);
    const bool was_running = running_.exchange(false, std::memory_order_acq_rel);

    // Поток проверяет running_ между кадрами, не позже wait_frame_ms.
    if (th_.joinable()) {
        th_.join();
        worker_id_.store(std::thread::id());
    }

    // Если не было запуска: нечего останавливать.
    if (!was_running) return StopResult::NotRunning;

    if (pipeline_->config().logging.stream_level_logger) {
        std::cout << "[STREAM] " << name_ << ": stopped after "
                  << frames_processed() << " frames" << std::endl;
    }
    return StopResult::Stopped;
}

void StreamWorker::set_sink(ResultSink sink) {
    std::lock_guard<std::mutex> lk(sink_mu_);
    sink_ = std::move(sink);
}

bool StreamWorker::latest_result(FrameResult& out) const {
    std::lock_guard<std::mutex> lk(result_mu_);
    if (!has_latest_) return false;
    out = latest_;
    return true;
}

void StreamWorker::publish(FrameResult&& r) {
    // sink вызывается без блокировки: он может звать set_sink()/stop()
    ResultSink sink;
    {
        std::lock_guard<std::mutex> lk(sink_mu_);
        sink = sink_;
    }
    if (sink) {
        try {
            sink(r);
        } catch (const std::exception& e) {
            std::cerr << "[STREAM] " << name_ << ": result sink failed: " << e.what() << std::endl;
        }
    }

    std::lock_guard<std::mutex> lk(result_mu_);
    latest_ = std::move(r);
    has_latest_ = true;
}

void StreamWorker::threadMain() {
    worker_id_.store(std::this_thread::get_id());
    const int wait_ms = pipeline_->config().stream.wait_frame_ms;
    cv::Mat frame;

    while (running_.load(std::memory_order_acquire)) {
        if (!frames_.waitFrame(frame, wait_ms)) {
            // источник остановлен: waitFrame возвращается сразу, не крутимся впустую
            if (frames_.isStopped()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(wait_ms));
            }
            continue;
        }

        // Кадр обрабатывается целиком, stop() дождётся конца.
        FrameResult r = pipeline_->process_frame(frame);
        frames_processed_.fetch_add(1, std::memory_order_relaxed);
        publish(std::move(r));
    }
}

} // namespace crowd::pipeline
