#include "crowd/core/frame_store.h"

#include <chrono>

namespace crowd::core {

void FrameStore::setFrame(cv::Mat&& frame) {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (stop_) return;
        last_ = std::move(frame);
        has_frame_ = true;
        ++seq_;
    }
    cv_.notify_all();   // <-- важно
}

void FrameStore::pushFrame(const cv::Mat& frame) {
    {
        std::lock_guard<std::mutex> lk(m_);
        if (stop_) return;
        last_ = frame;
        has_frame_ = true;
        ++seq_;
    }
    cv_.notify_all();   // <-- важно
}

bool FrameStore::waitFrame(cv::Mat& out, int timeout_ms) {
    std::unique_lock<std::mutex> lk(m_);

    // Кадр, который ещё не отдавали, возвращается сразу.
    const auto pred = [&]() {
        return stop_ || (has_frame_ && seq_ != consumed_);
    };

    if (!cv_.wait_for(lk, std::chrono::milliseconds(timeout_ms), pred)) {
        return false; // timeout
    }
    if (stop_) return false;

    // shallow copy: cv::Mat разделяет буфер, источник кладёт новые кадры новыми Mat
    out = last_;
    consumed_ = seq_;
    return true;
}

void FrameStore::stop() {
    {
        std::lock_guard<std::mutex> lk(m_);
        stop_ = true;
    }
    cv_.notify_all();
}

void FrameStore::reset() {
    std::lock_guard<std::mutex> lk(m_);
    stop_ = false;
    has_frame_ = false;
    last_.release();
    consumed_ = seq_;
}

bool FrameStore::isStopped() const {
    std::lock_guard<std::mutex> lk(m_);
    return stop_;
}

std::uint64_t FrameStore::sequence() const {
    std::lock_guard<std::mutex> lk(m_);
    return seq_;
}

} // namespace crowd::core
