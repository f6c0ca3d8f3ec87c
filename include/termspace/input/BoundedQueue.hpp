#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace TS {

/**
 * Fixed-capacity FIFO handing decoded input from the reader task to the main
 * loop. Producers block while the queue is full, up to a caller timeout;
 * nothing already queued is ever dropped.
 */
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(BoundedQueue const&)                    = delete;
    auto operator=(BoundedQueue const&) -> BoundedQueue& = delete;

    // False when still full after the timeout or when closed.
    template <typename Rep, typename Period>
    auto push(T value, std::chrono::duration<Rep, Period> timeout) -> bool {
        std::unique_lock lock(this->mutex);
        if (!this->notFull.wait_for(lock, timeout, [&] { return this->closed_ || this->items.size() < this->capacity_; }))
            return false;
        if (this->closed_)
            return false;
        this->items.push_back(std::move(value));
        lock.unlock();
        this->notEmpty.notify_one();
        return true;
    }

    auto tryPush(T value) -> bool {
        return this->push(std::move(value), std::chrono::milliseconds{0});
    }

    template <typename Rep, typename Period>
    auto pop(std::chrono::duration<Rep, Period> timeout) -> std::optional<T> {
        std::unique_lock lock(this->mutex);
        if (!this->notEmpty.wait_for(lock, timeout, [&] { return this->closed_ || !this->items.empty(); }))
            return std::nullopt;
        if (this->items.empty())
            return std::nullopt;
        T value = std::move(this->items.front());
        this->items.pop_front();
        lock.unlock();
        this->notFull.notify_one();
        return value;
    }

    auto tryPop() -> std::optional<T> {
        return this->pop(std::chrono::milliseconds{0});
    }

    // Removes up to max items without waiting.
    auto drain(std::size_t max) -> std::vector<T> {
        std::vector<T> out;
        {
            std::lock_guard lock(this->mutex);
            while (!this->items.empty() && out.size() < max) {
                out.push_back(std::move(this->items.front()));
                this->items.pop_front();
            }
        }
        if (!out.empty())
            this->notFull.notify_all();
        return out;
    }

    // Wakes every waiter; later pushes fail, queued items can still be popped.
    auto close() -> void {
        {
            std::lock_guard lock(this->mutex);
            this->closed_ = true;
        }
        this->notFull.notify_all();
        this->notEmpty.notify_all();
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard lock(this->mutex);
        return this->items.size();
    }

    [[nodiscard]] auto full() const -> bool {
        std::lock_guard lock(this->mutex);
        return this->items.size() >= this->capacity_;
    }

    [[nodiscard]] auto closed() const -> bool {
        std::lock_guard lock(this->mutex);
        return this->closed_;
    }

    [[nodiscard]] auto capacity() const -> std::size_t { return this->capacity_; }

private:
    mutable std::mutex      mutex;
    std::condition_variable notFull;
    std::condition_variable notEmpty;
    std::deque<T>           items;
    std::size_t const       capacity_;
    bool                    closed_ = false;
};

} // namespace TS
