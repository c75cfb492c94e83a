#pragma once

#include <atomic>
#include <chrono>
#include <optional>

namespace signalforge {
namespace backtest {

// Stop flag shared between the caller and the backtest workers, with an
// optional wall-clock deadline.
class CancellationToken {
public:
    CancellationToken() : cancelled_(false) {}

    void cancel() { cancelled_.store(true); }

    void setDeadline(std::chrono::steady_clock::time_point deadline) { deadline_ = deadline; }

    void setTimeout(std::chrono::milliseconds timeout) {
        deadline_ = std::chrono::steady_clock::now() + timeout;
    }

    bool isCancelled() const {
        if (cancelled_.load()) {
            return true;
        }
        return deadline_ && std::chrono::steady_clock::now() >= *deadline_;
    }

private:
    std::atomic<bool> cancelled_;
    std::optional<std::chrono::steady_clock::time_point> deadline_;
};

} // namespace backtest
} // namespace signalforge
