#pragma once

/**
 * @file cancel_token.h
 * @brief Cooperative cancellation flag shared by one turn's provider calls
 *
 * Providers poll it: libcurl through its progress callback, whisper through
 * its abort callback, Piper by watching its child process.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace voice_relay {

class CancelToken {
public:
    CancelToken() = default;

    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            canceled_.store(true);
        }
        cv_.notify_all();
    }

    bool is_canceled() const { return canceled_.load(); }

    /**
     * @brief Sleep up to `timeout`, returning early on cancel
     * @return true if canceled
     */
    template<typename Rep, typename Period>
    bool wait_for(const std::chrono::duration<Rep, Period>& timeout) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this] { return canceled_.load(); });
    }

private:
    std::atomic<bool> canceled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
};

using CancelTokenPtr = std::shared_ptr<CancelToken>;

} // namespace voice_relay
