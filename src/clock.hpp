// =============================================================================
// MenuPilot - Clock / StopToken
// =============================================================================
// 時間取得とスリープを抽象化（テストでは仮想時間を進める ManualClock を注入）。
// StopToken は SIGINT ハンドラ・stop() から立てられる協調停止フラグ。
// =============================================================================
#pragma once

#include <atomic>
#include <chrono>
#include <thread>

namespace menupilot {

using Millis = std::chrono::milliseconds;

class Clock {
public:
    using time_point = std::chrono::steady_clock::time_point;
    using duration = std::chrono::steady_clock::duration;

    virtual ~Clock() = default;
    virtual time_point now() const = 0;
    virtual void sleepFor(duration d) = 0;
};

class SteadyClock : public Clock {
public:
    time_point now() const override { return std::chrono::steady_clock::now(); }
    void sleepFor(duration d) override {
        if (d > duration::zero()) std::this_thread::sleep_for(d);
    }
};

// 秒(double) → steady_clock::duration
inline Clock::duration fromSeconds(double sec) {
    return std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<double>(sec));
}

inline double toSeconds(Clock::duration d) {
    return std::chrono::duration<double>(d).count();
}

// lock-free atomic<bool> のみ保持するためシグナルハンドラから store 可能
class StopToken {
public:
    void request() { stop_.store(true, std::memory_order_relaxed); }
    void reset() { stop_.store(false, std::memory_order_relaxed); }
    bool requested() const { return stop_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> stop_{false};
};

} // namespace menupilot
