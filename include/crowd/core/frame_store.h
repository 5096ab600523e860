#pragma once
#include <opencv2/core.hpp>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace crowd::core {

// Слот "последний кадр" между источником видео и рабочим потоком стрима.
// Хранится только самый свежий кадр, старые перезаписываются.
class FrameStore {
public:
    FrameStore() = default;

    void setFrame(cv::Mat&& frame);                 // используется источником видео
    void pushFrame(const cv::Mat& frame);           // опционально
    bool waitFrame(cv::Mat& out, int timeout_ms);
    void stop();
    void reset();                                   // снова принимать кадры после stop()
    bool isStopped() const;
    std::uint64_t sequence() const;

private:
    cv::Mat last_;
    bool has_frame_ = false;
    bool stop_ = false;
    std::uint64_t seq_ = 0;      // номер последнего опубликованного кадра
    std::uint64_t consumed_ = 0; // номер последнего отданного кадра

    mutable std::mutex m_;
    std::condition_variable cv_;
};

} // namespace crowd::core
