#include "hemascan/scheduler.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace hemascan {

SyncScheduler::SyncScheduler(SyncQueueManager &queue, std::chrono::seconds interval, Constraints constraints)
    : queue_(queue), interval_(interval), constraints_(std::move(constraints))
{
    if (interval_.count() <= 0) {
        throw std::invalid_argument("Sync interval must be positive");
    }
}

SyncScheduler::~SyncScheduler()
{
    stop();
}

bool SyncScheduler::constraintsMet() const
{
    return !constraints_ || constraints_();
}

void SyncScheduler::start()
{
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return;
    }
    stop_requested_.store(false);
    thread_ = std::thread([this]() { loop(); });
    std::cout << "[SYNC] Scheduler started, interval " << interval_.count() << " s" << std::endl;
}

void SyncScheduler::stop()
{
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        stop_requested_.store(true);
    }
    {
        std::lock_guard<std::mutex> lock(token_mutex_);
        if (active_token_) {
            active_token_->cancel();
        }
    }
    wait_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
        std::cout << "[SYNC] Scheduler stopped" << std::endl;
    }
    running_.store(false);
}

SyncCycleResult SyncScheduler::runOnce()
{
    if (!constraintsMet()) {
        std::cout << "[SYNC] Constraints not met, skipping cycle" << std::endl;
        SyncCycleResult skipped;
        skipped.outcome = SyncCycleResult::Outcome::Cancelled;
        skipped.retry = true;
        return skipped;
    }

    auto token = std::make_shared<CancellationToken>([this]() {
        return stop_requested_.load() || !constraintsMet();
    });
    {
        std::lock_guard<std::mutex> lock(token_mutex_);
        active_token_ = token;
    }
    SyncCycleResult result = queue_.runSyncCycle(*token);
    {
        std::lock_guard<std::mutex> lock(token_mutex_);
        active_token_.reset();
    }
    return result;
}

void SyncScheduler::loop()
{
    while (!stop_requested_.load()) {
        try {
            SyncCycleResult result = runOnce();
            if (result.outcome != SyncCycleResult::Outcome::NothingToSync) {
                std::cout << "[SYNC] Cycle " << toString(result.outcome) << " (" << result.record_count
                          << " records)" << std::endl;
            }
        } catch (const std::exception &ex) {
            std::cerr << "[SYNC] Cycle failed: " << ex.what() << std::endl;
        }

        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, interval_, [this]() { return stop_requested_.load(); });
    }
}

} // namespace hemascan
