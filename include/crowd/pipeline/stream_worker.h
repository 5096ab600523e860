#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "crowd/config.h"
#include "crowd/core/frame_store.h"
#include "crowd/pipeline/crowd_pipeline.h"

namespace crowd::pipeline {

enum class StartResult { Started, AlreadyRunning };
enum class StopResult { Stopped, NotRunning };

const char *to_string(StartResult r);
const char *to_string(StopResult r);

// Получатель результатов кадра. Вызывается из рабочего потока стрима, не должен блокировать.
using ResultSink = std::function<void(const FrameResult&)>;

// StreamWorker: один стрим (камера) = один пайплайн = один рабочий поток.
// 1) ждёт кадр через FrameStore::waitFrame (поток спит)
// 2) прогоняет кадр через CrowdPipeline целиком
// 3) публикует FrameResult: latest_result() + sink
// Остановка возможна только на границе кадра.
class StreamWorker {
public:
    StreamWorker(std::string name,
                 core::FrameStore& frames,
                 std::unique_ptr<CrowdPipeline> pipeline);
    ~StreamWorker();

    StreamWorker(const StreamWorker&) = delete;
    StreamWorker& operator=(const StreamWorker&) = delete;

    // Уже запущено -> AlreadyRunning, ничего не делаем.
    // start()/stop() из разных потоков сериализуются.
    StartResult start();

    // Не запущено -> NotRunning. Иначе дожидается конца текущего кадра и join.
    // Из sink: только снимает флаг, поток завершится после текущего кадра.
    StopResult stop();

    bool running() const { return running_.load(std::memory_order_acquire); }

    // Устанавливать до start() либо в любой момент: доступ под мьютексом.
    void set_sink(ResultSink sink);

    // false, если ещё ни один кадр не обработан.
    bool latest_result(FrameResult& out) const;

    std::uint64_t frames_processed() const { return frames_processed_.load(std::memory_order_relaxed); }

    // Доступ к пайплайну безопасен только когда поток остановлен.
    const CrowdPipeline& pipeline() const { return *pipeline_; }

    const std::string& name() const { return name_; }

private:
    void threadMain();
    void publish(FrameResult&& r);

    std::string name_;
    core::FrameStore& frames_;
    std::unique_ptr<CrowdPipeline> pipeline_;

    std::mutex control_mu_; // - сериализует start()/stop() и доступ к th_.
    std::atomic<bool> running_{false};
    std::atomic<std::thread::id> worker_id_{}; // - id рабочего потока (вызовы из sink).
    std::atomic<std::uint64_t> frames_processed_{0};
    std::thread th_;

    mutable std::mutex result_mu_;
    FrameResult latest_;
    bool has_latest_ = false;

    mutable std::mutex sink_mu_;
    ResultSink sink_;
};

} // namespace crowd::pipeline
