#pragma once

#include "hemascan/records.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace hemascan {

/*! Local scan store. Implementations must make each call atomic with respect to the others,
 *  so a diagnosis insert and a sync status update never interleave destructively.
 *  All methods throw PersistenceError on storage failure.
 */
class ScanRepository {
public:
    virtual ~ScanRepository() = default;

    virtual void insert(const ScanRecord &record) = 0;
    virtual void update(const ScanRecord &record) = 0;
    virtual std::optional<ScanRecord> get(const std::string &scan_id) const = 0;
    virtual std::vector<ScanRecord> listByStatus(SyncStatus status) const = 0;
    virtual std::size_t countByStatus(SyncStatus status) const = 0;
    virtual void markSynced(const std::vector<std::string> &scan_ids) = 0;
    virtual void markFailed(const std::vector<std::string> &scan_ids) = 0;
};

class InMemoryScanRepository : public ScanRepository {
public:
    void insert(const ScanRecord &record) override;
    void update(const ScanRecord &record) override;
    std::optional<ScanRecord> get(const std::string &scan_id) const override;
    std::vector<ScanRecord> listByStatus(SyncStatus status) const override;
    std::size_t countByStatus(SyncStatus status) const override;
    void markSynced(const std::vector<std::string> &scan_ids) override;
    void markFailed(const std::vector<std::string> &scan_ids) override;

    std::size_t size() const;

protected:
    // Called with mutex_ held after every mutation.
    virtual void persistLocked() {}

    void setStatusLocked(const std::vector<std::string> &scan_ids, SyncStatus status);
    // Persist, restoring previous if the write fails.
    void commitLocked(std::vector<ScanRecord> previous);

    mutable std::mutex mutex_;
    std::vector<ScanRecord> records_; //!< Insertion order.
};

/*! Scan store kept as a JSON document on disk, rewritten on every mutation. */
class JsonFileScanRepository : public InMemoryScanRepository {
public:
    //! \throws PersistenceError if an existing file cannot be parsed.
    explicit JsonFileScanRepository(std::string path);

    const std::string &path() const { return path_; }

protected:
    void persistLocked() override;

private:
    void loadLocked();

    std::string path_;
};

} // namespace hemascan
