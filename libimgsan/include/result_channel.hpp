/**
 * @file result_channel.hpp
 * @brief Bounded multi-producer / single-consumer channel.
 */

#ifndef IMGSAN_RESULT_CHANNEL_HPP
#define IMGSAN_RESULT_CHANNEL_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace imgsan {

/**
 * @brief Bounded FIFO used to hand results from workers to the aggregator.
 *
 * @details push() blocks while the channel is full, pop() blocks while it
 * is empty. After close() no new values are accepted; pop() keeps
 * returning buffered values and then std::nullopt.
 *
 * @tparam T Value type, moved through the channel.
 */
template <typename T>
class ResultChannel {
public:
    explicit ResultChannel(std::size_t capacity) : capacity_(capacity ? capacity : 1) {}

    ResultChannel(const ResultChannel&) = delete;
    ResultChannel& operator=(const ResultChannel&) = delete;

    /**
     * @brief Enqueue a value, waiting for space.
     * @return false if the channel was closed (the value is dropped).
     */
    bool push(T value) {
        std::unique_lock lock(mtx_);
        not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) return false;
        queue_.push_back(std::move(value));
        not_empty_.notify_one();
        return true;
    }

    /**
     * @brief Dequeue the next value, waiting for one.
     * @return std::nullopt once the channel is closed and drained.
     */
    std::optional<T> pop() {
        std::unique_lock lock(mtx_);
        not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return value;
    }

    /**
     * @brief Stop accepting values and wake every waiter.
     */
    void close() {
        {
            std::lock_guard lock(mtx_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard lock(mtx_);
        return closed_;
    }

private:
    const std::size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> queue_;
    bool closed_ = false;
};

} // namespace imgsan

#endif // IMGSAN_RESULT_CHANNEL_HPP
