#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

// Repeating timer on its own thread. The next wait starts when the previous
// callback returns, so slow ticks drift instead of queueing up.
class Ticker {
public:
    using Callback = std::function<void()>;

    explicit Ticker(Callback on_tick);
    ~Ticker();

    void Start(std::chrono::milliseconds period);
    void Stop();
    bool IsRunning() const;

    // Changes the period and restarts the countdown from now.
    void Reschedule(std::chrono::milliseconds period);
    std::chrono::milliseconds Period() const;

private:
    void Run();

    Callback on_tick_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::chrono::milliseconds period_{ 60000 };
    bool rescheduled_ = false;
    std::atomic<bool> running_{false};
    std::thread worker_;
};
