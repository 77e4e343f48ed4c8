#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <vector>

struct ErrorRecord {
    std::string message;
    // Underlying failure text, empty when there is none.
    std::string cause;
};

class ErrorSink {
public:
    using AlertCallback = std::function<void()>;

    void Record(const std::string& message, const std::string& cause = std::string());
    std::vector<ErrorRecord> Drain();
    std::vector<ErrorRecord> Peek() const;
    size_t Size() const;
    bool Empty() const;

    void SetAlertCallback(AlertCallback callback);

private:
    mutable std::mutex mutex_;
    std::vector<ErrorRecord> records_;
    AlertCallback on_alert_;
};
