#include "app/ErrorSink.h"

#include <iostream>
#include <utility>

void ErrorSink::Record(const std::string& message, const std::string& cause) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records_.push_back(ErrorRecord{ message, cause });
    }
    std::cerr << "Error: " << message;
    if (!cause.empty()) {
        std::cerr << " (" << cause << ")";
    }
    std::cerr << "\n";
    if (on_alert_) {
        on_alert_();
    }
}

std::vector<ErrorRecord> ErrorSink::Drain() {
    std::vector<ErrorRecord> out;
    std::lock_guard<std::mutex> lock(mutex_);
    out.swap(records_);
    return out;
}

std::vector<ErrorRecord> ErrorSink::Peek() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

size_t ErrorSink::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

bool ErrorSink::Empty() const {
    return Size() == 0;
}

void ErrorSink::SetAlertCallback(AlertCallback callback) {
    on_alert_ = std::move(callback);
}
