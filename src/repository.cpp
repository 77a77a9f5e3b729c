#include "hemascan/repository.hpp"
#include "hemascan/errors.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <set>
#include <system_error>

namespace hemascan {

void InMemoryScanRepository::insert(const ScanRecord &record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (record.scan_id.empty()) {
        throw PersistenceError("Scan record has no id");
    }
    std::vector<ScanRecord> previous = records_;
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const ScanRecord &r) { return r.scan_id == record.scan_id; });
    if (it != records_.end()) {
        *it = record;
    } else {
        records_.push_back(record);
    }
    commitLocked(std::move(previous));
}

void InMemoryScanRepository::update(const ScanRecord &record)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(records_.begin(), records_.end(),
                           [&](const ScanRecord &r) { return r.scan_id == record.scan_id; });
    if (it == records_.end()) {
        throw PersistenceError("Unknown scan id: " + record.scan_id);
    }
    std::vector<ScanRecord> previous = records_;
    records_[static_cast<std::size_t>(it - records_.begin())] = record;
    commitLocked(std::move(previous));
}

std::optional<ScanRecord> InMemoryScanRepository::get(const std::string &scan_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &record : records_) {
        if (record.scan_id == scan_id) {
            return record;
        }
    }
    return std::nullopt;
}

std::vector<ScanRecord> InMemoryScanRepository::listByStatus(SyncStatus status) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ScanRecord> out;
    std::copy_if(records_.begin(), records_.end(), std::back_inserter(out),
                 [status](const ScanRecord &r) { return r.sync_status == status; });
    return out;
}

std::size_t InMemoryScanRepository::countByStatus(SyncStatus status) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(records_.begin(), records_.end(),
                                                  [status](const ScanRecord &r) { return r.sync_status == status; }));
}

void InMemoryScanRepository::markSynced(const std::vector<std::string> &scan_ids)
{
    std::lock_guard<std::mutex> lock(mutex_);
    setStatusLocked(scan_ids, SyncStatus::SYNCED);
}

void InMemoryScanRepository::markFailed(const std::vector<std::string> &scan_ids)
{
    std::lock_guard<std::mutex> lock(mutex_);
    setStatusLocked(scan_ids, SyncStatus::FAILED);
}

std::size_t InMemoryScanRepository::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

void InMemoryScanRepository::setStatusLocked(const std::vector<std::string> &scan_ids, SyncStatus status)
{
    if (scan_ids.empty()) {
        return;
    }
    std::set<std::string> wanted(scan_ids.begin(), scan_ids.end());
    std::vector<ScanRecord> previous = records_;
    for (auto &record : records_) {
        if (wanted.count(record.scan_id)) {
            record.sync_status = status;
        }
    }
    commitLocked(std::move(previous));
}

void InMemoryScanRepository::commitLocked(std::vector<ScanRecord> previous)
{
    try {
        persistLocked();
    } catch (const PersistenceError &) {
        records_ = std::move(previous);
        throw;
    }
}

JsonFileScanRepository::JsonFileScanRepository(std::string path) : path_(std::move(path))
{
    std::lock_guard<std::mutex> lock(mutex_);
    loadLocked();
}

void JsonFileScanRepository::loadLocked()
{
    if (!std::filesystem::exists(path_)) {
        return;
    }
    try {
        Json root = Json::parse_file(path_);
        if (!root.contains("scans")) {
            return;
        }
        for (const auto &entry : root["scans"].as_array()) {
            records_.push_back(recordFromJson(entry));
        }
        std::cout << "[STORE] Loaded " << records_.size() << " scan records from " << path_ << std::endl;
    } catch (const std::exception &ex) {
        throw PersistenceError("Failed to load scan store " + path_ + ": " + ex.what());
    }
}

void JsonFileScanRepository::persistLocked()
{
    Json root = makeObject();
    Json scans = makeArray();
    for (const auto &record : records_) {
        scans.push_back(recordToJson(record));
    }
    root["scans"] = scans;

    std::filesystem::path target(path_);
    std::error_code ec;
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
    }

    // Staged write, renamed over the target.
    std::filesystem::path staging = target;
    staging += ".tmp";
    {
        std::ofstream output(staging, std::ios::trunc);
        if (!output) {
            throw PersistenceError("Failed to write scan store: " + staging.string());
        }
        output << root.dump(2) << "\n";
        if (!output) {
            throw PersistenceError("Failed to flush scan store: " + staging.string());
        }
    }
    std::filesystem::rename(staging, target, ec);
    if (ec) {
        throw PersistenceError("Failed to replace scan store " + path_ + ": " + ec.message());
    }
}

} // namespace hemascan
