#ifndef SYNC_SCHEDULER_HPP
#define SYNC_SCHEDULER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <thread>
#include "repository_mirror.hpp"

namespace mirror {

/**
 * @brief Runs RepositoryMirror::refresh() on a fixed start-to-start interval.
 *
 * The first refresh runs as soon as start() is called; attempt k starts at
 * `t0 + k * interval`. When a refresh overruns one or more boundaries those
 * ticks are skipped and the next attempt waits for the next boundary, so
 * refreshes never overlap. A failed refresh is simply retried on the next
 * tick.
 */
class SyncScheduler {
  public:
    using clock = std::chrono::steady_clock;

    /** @throws std::invalid_argument if @p interval is not positive. */
    SyncScheduler(RepositoryMirror& mirror, std::chrono::milliseconds interval);
    ~SyncScheduler();
    SyncScheduler(const SyncScheduler&) = delete;
    SyncScheduler& operator=(const SyncScheduler&) = delete;

    /// Start the timer thread. Does nothing when already running.
    void start();

    /// Wake the timer and wait for an in-flight refresh to finish.
    void stop();

    bool running() const { return running_.load(); }
    size_t runs() const { return runs_.load(); }
    size_t skipped_ticks() const { return skipped_.load(); }
    std::chrono::milliseconds interval() const { return interval_; }

  private:
    void loop();

    RepositoryMirror& mirror_;
    const std::chrono::milliseconds interval_;
    std::thread thread_;
    std::mutex control_mtx_; ///< Serializes start() and stop()
    std::mutex mtx_;
    std::condition_variable cv_;
    bool stop_requested_ = false;
    std::atomic<bool> running_{false};
    std::atomic<size_t> runs_{0};
    std::atomic<size_t> skipped_{0};
};

} // namespace mirror

#endif // SYNC_SCHEDULER_HPP
