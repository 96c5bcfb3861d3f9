#include "sync_scheduler.hpp"
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include "logger.hpp"
#include "time_utils.hpp"

namespace mirror {

SyncScheduler::SyncScheduler(RepositoryMirror& mirror, std::chrono::milliseconds interval)
    : mirror_(mirror), interval_(interval) {
    if (interval_.count() <= 0)
        throw std::invalid_argument("sync interval must be positive");
}

SyncScheduler::~SyncScheduler() { stop(); }

void SyncScheduler::start() {
    std::lock_guard<std::mutex> ctl(control_mtx_);
    if (running_.load())
        return;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stop_requested_ = false;
    }
    running_.store(true);
    thread_ = std::thread(&SyncScheduler::loop, this);
    log_info("Sync scheduler started",
             {{"interval", format_duration_short(
                               std::chrono::duration_cast<std::chrono::seconds>(interval_))}});
}

void SyncScheduler::stop() {
    std::lock_guard<std::mutex> ctl(control_mtx_);
    if (!running_.load())
        return;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable())
        thread_.join();
    running_.store(false);
    log_info("Sync scheduler stopped", {{"runs", std::to_string(runs_.load())}});
}

void SyncScheduler::loop() {
    const clock::time_point t0 = clock::now();
    std::int64_t tick = 0;
    std::unique_lock<std::mutex> lk(mtx_);
    while (!stop_requested_) {
        lk.unlock();
        const auto started = clock::now();
        const RefreshOutcome outcome = mirror_.refresh();
        const auto took =
            std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - started);
        ++runs_;
        const std::map<std::string, std::string> fields{
            {"outcome", refresh_outcome_name(outcome)},
            {"took_ms", std::to_string(took.count())}};
        if (outcome == RefreshOutcome::Failed || outcome == RefreshOutcome::Busy)
            log_warning("Refresh did not complete, retrying at next tick", fields);
        else
            log_debug("Refresh finished", fields);

        lk.lock();
        ++tick;
        const std::int64_t passed = (clock::now() - t0) / interval_;
        if (passed >= tick) {
            const std::int64_t missed = passed + 1 - tick;
            skipped_ += static_cast<size_t>(missed);
            log_warning("Refresh overran the sync interval",
                        {{"skipped_ticks", std::to_string(missed)}});
            tick = passed + 1;
        }
        cv_.wait_until(lk, t0 + interval_ * tick, [this] { return stop_requested_; });
    }
}

} // namespace mirror
