#include "hemascan/sync.hpp"

#include "hemascan/common.hpp"
#include "hemascan/errors.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace hemascan {

std::string toString(SyncCycleResult::Outcome outcome)
{
    switch (outcome) {
    case SyncCycleResult::Outcome::NothingToSync: return "nothing_to_sync";
    case SyncCycleResult::Outcome::Synced: return "synced";
    case SyncCycleResult::Outcome::Failed: return "failed";
    case SyncCycleResult::Outcome::Cancelled: return "cancelled";
    }
    return "unknown";
}

SyncQueueManager::SyncQueueManager(ScanRepository &repository, SyncTransport &transport, std::string device_id)
    : repository_(repository), transport_(transport), device_id_(std::move(device_id))
{
    if (device_id_.empty()) {
        throw std::invalid_argument("Sync device id is empty");
    }
}

std::vector<ScanRecord> SyncQueueManager::selectUnsynced() const
{
    std::vector<ScanRecord> batch = repository_.listByStatus(SyncStatus::PENDING);
    std::vector<ScanRecord> failed = repository_.listByStatus(SyncStatus::FAILED);
    batch.insert(batch.end(), failed.begin(), failed.end());
    return batch;
}

std::size_t SyncQueueManager::pendingCount() const
{
    return repository_.countByStatus(SyncStatus::PENDING) + repository_.countByStatus(SyncStatus::FAILED);
}

Json SyncQueueManager::buildPayload(const std::vector<ScanRecord> &records, std::int64_t timestamp_ms) const
{
    Json payload = makeObject();
    payload["device_id"] = device_id_;
    payload["timestamp"] = timestamp_ms;
    payload["count"] = records.size();

    Json scans = makeArray();
    double risk_sum = 0.0;
    int high = 0;
    int moderate = 0;
    int low = 0;
    for (const auto &record : records) {
        Json scan = makeObject();
        scan["scan_type"] = toString(record.scan_type);
        scan["risk_score"] = record.risk_score;
        scan["risk_level"] = toString(record.risk_level);
        scan["confidence"] = record.confidence;
        scan["inference_time_ms"] = record.inference_time_ms;
        if (!record.feature_vector.empty()) {
            try {
                scan["features"] = Json::parse(record.feature_vector);
            } catch (const std::exception &ex) {
                std::cerr << "[SYNC] Dropping unreadable feature vector of scan " << record.scan_id << ": "
                          << ex.what() << std::endl;
            }
        }
        scans.push_back(std::move(scan));

        risk_sum += record.risk_score;
        switch (record.risk_level) {
        case RiskLevel::RED: ++high; break;
        case RiskLevel::AMBER: ++moderate; break;
        case RiskLevel::GREEN: ++low; break;
        }
    }
    payload["scans"] = std::move(scans);

    Json stats = makeObject();
    stats["avg_risk_score"] = records.empty() ? 0.0 : risk_sum / static_cast<double>(records.size());
    stats["high_risk_count"] = high;
    stats["moderate_risk_count"] = moderate;
    stats["low_risk_count"] = low;
    payload["stats"] = std::move(stats);
    return payload;
}

SyncCycleResult SyncQueueManager::runSyncCycle(const CancellationToken &token)
{
    std::lock_guard<std::mutex> lock(cycle_mutex_);

    SyncCycleResult result;
    std::vector<ScanRecord> batch;
    try {
        batch = selectUnsynced();
    } catch (const std::exception &ex) {
        std::cerr << "[SYNC] Failed to read scan store: " << ex.what() << std::endl;
        result.outcome = SyncCycleResult::Outcome::Failed;
        result.retry = true;
        result.error = ex.what();
        return result;
    }

    if (batch.empty()) {
        return result;
    }
    result.record_count = batch.size();

    std::vector<std::string> ids;
    ids.reserve(batch.size());
    for (const auto &record : batch) {
        ids.push_back(record.scan_id);
    }

    if (token.cancelled()) {
        std::cout << "[SYNC] Cycle cancelled before send, " << batch.size() << " records left unchanged"
                  << std::endl;
        result.outcome = SyncCycleResult::Outcome::Cancelled;
        result.retry = true;
        return result;
    }

    TransportStatus status = TransportStatus::Failed;
    try {
        std::string payload = buildPayload(batch, currentEpochMillis()).dump();
        status = transport_.send(payload, token);
    } catch (const std::exception &ex) {
        std::cerr << "[SYNC] Transport error: " << ex.what() << std::endl;
        result.error = ex.what();
        status = TransportStatus::Failed;
    }

    try {
        switch (status) {
        case TransportStatus::Delivered:
            repository_.markSynced(ids);
            result.outcome = SyncCycleResult::Outcome::Synced;
            std::cout << "[SYNC] Synced " << ids.size() << " records" << std::endl;
            break;
        case TransportStatus::Cancelled:
            result.outcome = SyncCycleResult::Outcome::Cancelled;
            result.retry = true;
            std::cout << "[SYNC] Cycle cancelled, " << ids.size() << " records left unchanged" << std::endl;
            break;
        case TransportStatus::Failed:
            repository_.markFailed(ids);
            result.outcome = SyncCycleResult::Outcome::Failed;
            result.retry = true;
            if (result.error.empty()) {
                result.error = "transport rejected batch";
            }
            std::cerr << "[SYNC] Batch of " << ids.size() << " records failed, retrying next cycle" << std::endl;
            break;
        }
    } catch (const std::exception &ex) {
        std::cerr << "[SYNC] Failed to record sync status: " << ex.what() << std::endl;
        result.outcome = SyncCycleResult::Outcome::Failed;
        result.retry = true;
        result.error = ex.what();
    }
    return result;
}

} // namespace hemascan
