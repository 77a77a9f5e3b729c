#pragma once

#include "hemascan/json.hpp"
#include "hemascan/repository.hpp"
#include "hemascan/transport.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace hemascan {

struct SyncCycleResult {
    enum class Outcome { NothingToSync, Synced, Failed, Cancelled };

    Outcome outcome = Outcome::NothingToSync;
    std::size_t record_count = 0;
    bool retry = false;       //!< Scheduler should try again on its next tick.
    std::string error;
};

std::string toString(SyncCycleResult::Outcome outcome);

/*! Batches every unsynced scan into one anonymised payload and drives the
 *  PENDING -> SYNCED | FAILED transitions. FAILED records are re-selected on
 *  the next cycle. Cycles never overlap.
 */
class SyncQueueManager {
public:
    SyncQueueManager(ScanRepository &repository, SyncTransport &transport, std::string device_id);

    SyncCycleResult runSyncCycle(const CancellationToken &token = CancellationToken());

    //! Records not yet synced (PENDING plus FAILED).
    std::size_t pendingCount() const;

    //! Anonymised batch document: device id, timestamp, per-scan results and tier statistics.
    Json buildPayload(const std::vector<ScanRecord> &records, std::int64_t timestamp_ms) const;

    const std::string &deviceId() const { return device_id_; }

private:
    std::vector<ScanRecord> selectUnsynced() const;

    ScanRepository &repository_;
    SyncTransport &transport_;
    std::string device_id_;
    std::mutex cycle_mutex_;
};

} // namespace hemascan
