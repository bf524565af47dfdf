#ifndef TPCH_BENCH_RESULT_CHANNEL_H_
#define TPCH_BENCH_RESULT_CHANNEL_H_

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace tpch {
namespace bench {

/**
 * @brief Unbounded multi-producer single-consumer channel with blocking receive.
 *
 * Producers are execution units that each send exactly one message; the
 * consumer drains after starting them. Messages from one producer are
 * received in the order they were sent.
 *
 * @tparam T Message type
 */
template<typename T>
class ResultChannel {
public:
    ResultChannel() = default;

    // Non-copyable, non-movable
    ResultChannel(const ResultChannel&) = delete;
    ResultChannel& operator=(const ResultChannel&) = delete;

    void send(T message) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(message));
            ++sent_;
        }
        cond_.notify_one();
    }

    /**
     * @brief Block until a message is available
     */
    T receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        cond_.wait(lock, [this] { return !queue_.empty(); });
        return pop_locked();
    }

    /**
     * @brief Block until a message is available or the timeout expires
     * @return The message, or nullopt on timeout
     *
     * The orchestrator drains against a fixed deadline with receive_until;
     * this relative form is kept for tests and callers without a deadline.
     */
    template<typename Rep, typename Period>
    std::optional<T> receive_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cond_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
            return std::nullopt;
        }
        return pop_locked();
    }

    /**
     * @brief Block until a message is available or the deadline passes
     */
    template<typename Clock, typename Duration>
    std::optional<T> receive_until(std::chrono::time_point<Clock, Duration> deadline) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cond_.wait_until(lock, deadline, [this] { return !queue_.empty(); })) {
            return std::nullopt;
        }
        return pop_locked();
    }

    // Messages sent so far; tests use it to check the one-message contract
    size_t total_sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

private:
    T pop_locked() {
        T message = std::move(queue_.front());
        queue_.pop_front();
        return message;
    }

    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<T> queue_;
    size_t sent_ = 0;
};

} // namespace bench
} // namespace tpch

#endif // TPCH_BENCH_RESULT_CHANNEL_H_
