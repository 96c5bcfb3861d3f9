#ifndef BOUNDED_QUEUE_HPP
#define BOUNDED_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

/**
 * @brief Thread-safe FIFO with a capacity limit and close support.
 *
 * After close() pushes fail, and pops drain what is left before failing.
 */
template <typename T> class BoundedQueue {
  public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {}
    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /// Blocks while full. Returns `false` once the queue is closed.
    bool push(T item) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_full_.wait(lk, [&] { return q_.size() < capacity_ || closed_; });
        if (closed_)
            return false;
        q_.push(std::move(item));
        cv_empty_.notify_one();
        return true;
    }

    /// Blocks while empty. Returns `false` when closed and drained.
    bool pop(T& out) {
        std::unique_lock<std::mutex> lk(mu_);
        cv_empty_.wait(lk, [&] { return !q_.empty() || closed_; });
        if (q_.empty())
            return false;
        out = std::move(q_.front());
        q_.pop();
        cv_full_.notify_one();
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lk(mu_);
        closed_ = true;
        cv_empty_.notify_all();
        cv_full_.notify_all();
    }

  private:
    size_t capacity_;
    std::queue<T> q_;
    std::mutex mu_;
    std::condition_variable cv_empty_;
    std::condition_variable cv_full_;
    bool closed_ = false;
};

#endif // BOUNDED_QUEUE_HPP
