/**
 * @file bounded_channel.hpp
 * @brief Bounded, closable FIFO channel between producer threads and one consumer.
 *
 * send() blocks while the buffer is full. close() stops intake; receive()
 * keeps returning buffered items until the buffer is empty and then
 * returns std::nullopt, which is the consumer's signal to exit.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace fabric_controller {

template <typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    /// Blocks while full. Returns false if the channel is (or becomes) closed.
    bool send(T item) {
        std::unique_lock lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || buffer_.size() < capacity_; });
        if (closed_) return false;
        buffer_.push_back(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return true;
    }

    /// Non-blocking send. Returns false if full or closed.
    bool try_send(T item) {
        {
            std::lock_guard lock(mutex_);
            if (closed_ || buffer_.size() >= capacity_) return false;
            buffer_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /// Blocks until an item is available, or the channel is closed and drained.
    std::optional<T> receive() {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !buffer_.empty(); });
        if (buffer_.empty()) return std::nullopt;
        T item = std::move(buffer_.front());
        buffer_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    void close() {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard lock(mutex_);
        return buffer_.size();
    }

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T> buffer_;
    bool closed_ = false;
};

}  // namespace fabric_controller
