#include <gtest/gtest.h>

#include "hemascan/device_identity.hpp"
#include "hemascan/records.hpp"
#include "hemascan/repository.hpp"
#include "hemascan/scheduler.hpp"
#include "hemascan/sync.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace hemascan;

namespace {

class ScriptedTransport : public SyncTransport {
public:
    TransportStatus status = TransportStatus::Delivered;
    bool throw_error = false;
    std::vector<std::string> payloads;

    TransportStatus send(const std::string &payload, const CancellationToken &) override
    {
        payloads.push_back(payload);
        if (throw_error) {
            throw std::runtime_error("connection reset");
        }
        return status;
    }
};

// Blocks until cancelled, like a transport waiting on a slow broker.
class HangingTransport : public SyncTransport {
public:
    std::atomic<bool> entered{false};

    TransportStatus send(const std::string &, const CancellationToken &token) override
    {
        entered.store(true);
        while (!token.cancelled()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return TransportStatus::Cancelled;
    }
};

// Store whose status writes fail with a generic error.
class FlakyRepository : public InMemoryScanRepository {
public:
    void markSynced(const std::vector<std::string> &) override { throw std::runtime_error("database locked"); }
    void markFailed(const std::vector<std::string> &) override { throw std::runtime_error("database locked"); }
};

ScanRecord makeRecord(const std::string &id, RiskLevel level, double score)
{
    ScanRecord record;
    record.scan_id = id;
    record.patient_id = "Jane Roe";
    record.scan_type = ScanType::EYE_CONJUNCTIVA;
    record.local_image_path = "/sdcard/hemascan/" + id + ".jpg";
    record.vitals.known_hemoglobin = 8.7;
    record.vitals.fatigue_level = 6;
    record.risk_score = score;
    record.risk_level = level;
    record.confidence = 0.65;
    record.inference_time_ms = 15;
    ColorFeatures features;
    features.mean_red = 120;
    features.mean_green = 110;
    features.mean_blue = 100;
    features.saturation = 0.2;
    features.brightness = 0.5;
    features.pallor_index = 0.3;
    record.feature_vector = encodeFeatureVector(features, record.vitals);
    return record;
}

void seed(ScanRepository &repo, int count)
{
    for (int i = 0; i < count; ++i) {
        repo.insert(makeRecord("scan" + std::to_string(i), RiskLevel::AMBER, 0.5));
    }
}

} // namespace

TEST(SyncQueueManager, EmptyQueueSkipsTransport)
{
    InMemoryScanRepository repo;
    ScriptedTransport transport;
    SyncQueueManager queue(repo, transport, "device-1");

    SyncCycleResult result = queue.runSyncCycle();
    EXPECT_EQ(result.outcome, SyncCycleResult::Outcome::NothingToSync);
    EXPECT_FALSE(result.retry);
    EXPECT_TRUE(transport.payloads.empty());
}

TEST(SyncQueueManager, SuccessMarksWholeBatchSynced)
{
    InMemoryScanRepository repo;
    ScriptedTransport transport;
    SyncQueueManager queue(repo, transport, "device-1");
    seed(repo, 5);

    SyncCycleResult result = queue.runSyncCycle();
    EXPECT_EQ(result.outcome, SyncCycleResult::Outcome::Synced);
    EXPECT_EQ(result.record_count, 5u);
    EXPECT_EQ(repo.countByStatus(SyncStatus::SYNCED), 5u);
    EXPECT_EQ(queue.pendingCount(), 0u);

    EXPECT_EQ(queue.runSyncCycle().outcome, SyncCycleResult::Outcome::NothingToSync);
    EXPECT_EQ(transport.payloads.size(), 1u);
}

TEST(SyncQueueManager, FailureMarksBatchFailedAndRetriesNextCycle)
{
    InMemoryScanRepository repo;
    ScriptedTransport transport;
    transport.status = TransportStatus::Failed;
    SyncQueueManager queue(repo, transport, "device-1");
    seed(repo, 4);

    SyncCycleResult first = queue.runSyncCycle();
    EXPECT_EQ(first.outcome, SyncCycleResult::Outcome::Failed);
    EXPECT_TRUE(first.retry);
    EXPECT_EQ(repo.countByStatus(SyncStatus::FAILED), 4u);
    EXPECT_EQ(queue.pendingCount(), 4u);

    repo.insert(makeRecord("late", RiskLevel::GREEN, 0.1));
    transport.status = TransportStatus::Delivered;
    SyncCycleResult second = queue.runSyncCycle();
    EXPECT_EQ(second.outcome, SyncCycleResult::Outcome::Synced);
    EXPECT_EQ(second.record_count, 5u);
    EXPECT_EQ(repo.countByStatus(SyncStatus::SYNCED), 5u);
    EXPECT_EQ(Json::parse(transport.payloads.back())["count"].as_number(), 5);
}

TEST(SyncQueueManager, TransportExceptionCountsAsFailure)
{
    InMemoryScanRepository repo;
    ScriptedTransport transport;
    transport.throw_error = true;
    SyncQueueManager queue(repo, transport, "device-1");
    seed(repo, 2);

    SyncCycleResult result = queue.runSyncCycle();
    EXPECT_EQ(result.outcome, SyncCycleResult::Outcome::Failed);
    EXPECT_EQ(result.error, "connection reset");
    EXPECT_EQ(repo.countByStatus(SyncStatus::FAILED), 2u);
}

TEST(SyncQueueManager, StatusWriteErrorIsContained)
{
    FlakyRepository repo;
    ScriptedTransport transport;
    SyncQueueManager queue(repo, transport, "device-1");
    seed(repo, 2);

    SyncCycleResult delivered;
    EXPECT_NO_THROW(delivered = queue.runSyncCycle());
    EXPECT_EQ(delivered.outcome, SyncCycleResult::Outcome::Failed);
    EXPECT_TRUE(delivered.retry);
    EXPECT_EQ(delivered.error, "database locked");
    EXPECT_EQ(queue.pendingCount(), 2u);

    transport.status = TransportStatus::Failed;
    EXPECT_NO_THROW(queue.runSyncCycle());
}

TEST(SyncQueueManager, CancelledCycleLeavesRecordsUntouched)
{
    InMemoryScanRepository repo;
    ScriptedTransport transport;
    transport.status = TransportStatus::Cancelled;
    SyncQueueManager queue(repo, transport, "device-1");
    seed(repo, 3);
    repo.markFailed({"scan0"});

    SyncCycleResult result = queue.runSyncCycle();
    EXPECT_EQ(result.outcome, SyncCycleResult::Outcome::Cancelled);
    EXPECT_EQ(repo.get("scan0")->sync_status, SyncStatus::FAILED);
    EXPECT_EQ(repo.countByStatus(SyncStatus::PENDING), 2u);

    CancellationToken token;
    token.cancel();
    transport.status = TransportStatus::Delivered;
    EXPECT_EQ(queue.runSyncCycle(token).outcome, SyncCycleResult::Outcome::Cancelled);
    EXPECT_EQ(transport.payloads.size(), 1u);
    EXPECT_EQ(repo.countByStatus(SyncStatus::SYNCED), 0u);
}

TEST(SyncQueueManager, PayloadCarriesNoIdentifyingData)
{
    InMemoryScanRepository repo;
    ScriptedTransport transport;
    SyncQueueManager queue(repo, transport, "device-xyz");
    repo.insert(makeRecord("r1", RiskLevel::RED, 0.8));
    repo.insert(makeRecord("r2", RiskLevel::AMBER, 0.5));
    repo.insert(makeRecord("r3", RiskLevel::GREEN, 0.2));

    queue.runSyncCycle();
    ASSERT_EQ(transport.payloads.size(), 1u);
    const std::string &text = transport.payloads.front();
    EXPECT_EQ(text.find("Jane Roe"), std::string::npos);
    EXPECT_EQ(text.find("/sdcard"), std::string::npos);
    EXPECT_EQ(text.find("hemoglobin"), std::string::npos);
    EXPECT_EQ(text.find("8.7"), std::string::npos);
    EXPECT_EQ(text.find("fatigue_level"), std::string::npos);
    EXPECT_EQ(text.find("patient"), std::string::npos);
    EXPECT_EQ(text.find("scan_id"), std::string::npos);

    Json payload = Json::parse(text);
    EXPECT_EQ(payload["device_id"].as_string(), "device-xyz");
    EXPECT_EQ(payload["count"].as_number(), 3);
    EXPECT_GT(payload["timestamp"].as_number(), 0);
    const auto &scans = payload["scans"].as_array();
    ASSERT_EQ(scans.size(), 3u);
    EXPECT_EQ(scans[0]["scan_type"].as_string(), "EYE_CONJUNCTIVA");
    EXPECT_EQ(scans[0]["risk_level"].as_string(), "RED");
    EXPECT_TRUE(scans[0]["features"]["has_fatigue"].as_bool());

    const Json &stats = payload["stats"];
    EXPECT_NEAR(stats["avg_risk_score"].as_number(), 0.5, 1e-9);
    EXPECT_EQ(stats["high_risk_count"].as_number(), 1);
    EXPECT_EQ(stats["moderate_risk_count"].as_number(), 1);
    EXPECT_EQ(stats["low_risk_count"].as_number(), 1);
}

TEST(SyncScheduler, SkipsCycleWhenConstraintsUnmet)
{
    InMemoryScanRepository repo;
    ScriptedTransport transport;
    SyncQueueManager queue(repo, transport, "device-1");
    seed(repo, 1);
    bool on_wifi = false;
    SyncScheduler scheduler(queue, std::chrono::seconds(60), [&on_wifi]() { return on_wifi; });

    EXPECT_EQ(scheduler.runOnce().outcome, SyncCycleResult::Outcome::Cancelled);
    EXPECT_TRUE(transport.payloads.empty());

    on_wifi = true;
    EXPECT_EQ(scheduler.runOnce().outcome, SyncCycleResult::Outcome::Synced);
}

TEST(SyncScheduler, StopCancelsInFlightSend)
{
    InMemoryScanRepository repo;
    HangingTransport transport;
    SyncQueueManager queue(repo, transport, "device-1");
    seed(repo, 2);

    SyncScheduler scheduler(queue, std::chrono::seconds(3600));
    scheduler.start();
    while (!transport.entered.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    scheduler.stop();
    EXPECT_FALSE(scheduler.running());
    EXPECT_EQ(repo.countByStatus(SyncStatus::PENDING), 2u);
}

TEST(DeviceIdentity, CreatedOnceThenReused)
{
    std::filesystem::path file = std::filesystem::temp_directory_path() /
                                 ("hemascan_id_" + std::to_string(::getpid())) / "device_id";
    std::filesystem::remove(file);

    DeviceIdentity first = DeviceIdentity::loadOrCreate(file.string());
    DeviceIdentity second = DeviceIdentity::loadOrCreate(file.string());
    EXPECT_EQ(first.id(), second.id());
    ASSERT_EQ(first.id().size(), 36u);
    EXPECT_EQ(first.id()[14], '4');
}

TEST(DeviceIdentity, GeneratedIdsDiffer)
{
    EXPECT_NE(generateUuid(), generateUuid());
}

TEST(SyncScheduler, StopReturnsPromptlyDuringLongInterval)
{
    InMemoryScanRepository repo;
    ScriptedTransport transport;
    SyncQueueManager queue(repo, transport, "device-1");
    SyncScheduler scheduler(queue, std::chrono::hours(6));

    const auto begin = std::chrono::steady_clock::now();
    for (int i = 0; i < 200; ++i) {
        scheduler.start();
        scheduler.stop();
    }
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(10));
    EXPECT_FALSE(scheduler.running());
}
