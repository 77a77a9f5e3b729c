#pragma once

#include "hemascan/sync.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace hemascan {

/*! Runs a sync cycle every interval while the run constraints hold
 *  (network class, power state, as reported by the constraints predicate).
 *  A cycle in flight is cancelled when the constraints stop holding or stop() is called.
 */
class SyncScheduler {
public:
    using Constraints = std::function<bool()>;

    SyncScheduler(SyncQueueManager &queue, std::chrono::seconds interval, Constraints constraints = {});
    ~SyncScheduler();

    SyncScheduler(const SyncScheduler &) = delete;
    SyncScheduler &operator=(const SyncScheduler &) = delete;

    void start();
    void stop();
    bool running() const { return running_.load(); }

    //! Run one cycle now on the calling thread, subject to the same constraints.
    SyncCycleResult runOnce();

private:
    void loop();
    bool constraintsMet() const;

    SyncQueueManager &queue_;
    std::chrono::seconds interval_;
    Constraints constraints_;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
    std::mutex token_mutex_;
    std::shared_ptr<CancellationToken> active_token_;
    std::thread thread_;
};

} // namespace hemascan
