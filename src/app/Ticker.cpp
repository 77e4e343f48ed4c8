#include "app/Ticker.h"

#include <algorithm>
#include <utility>

Ticker::Ticker(Callback on_tick) : on_tick_(std::move(on_tick)) {}

Ticker::~Ticker() {
    Stop();
}

void Ticker::Start(std::chrono::milliseconds period) {
    if (running_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        period_ = std::max(period, std::chrono::milliseconds(1));
        rescheduled_ = false;
    }
    running_ = true;
    worker_ = std::thread(&Ticker::Run, this);
}

void Ticker::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool Ticker::IsRunning() const {
    return running_.load();
}

void Ticker::Reschedule(std::chrono::milliseconds period) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        period_ = std::max(period, std::chrono::milliseconds(1));
        rescheduled_ = true;
    }
    cv_.notify_all();
}

std::chrono::milliseconds Ticker::Period() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return period_;
}

void Ticker::Run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        auto deadline = std::chrono::steady_clock::now() + period_;
        bool woken = cv_.wait_until(lock, deadline, [this] { return !running_ || rescheduled_; });
        if (!running_) {
            break;
        }
        if (woken) {
            rescheduled_ = false;
            continue;
        }
        lock.unlock();
        if (on_tick_) {
            on_tick_();
        }
        lock.lock();
    }
}
