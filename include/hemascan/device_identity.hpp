#pragma once

#include <string>
#include <utility>

namespace hemascan {

//! Random RFC 4122 version 4 identifier, lowercase hex with dashes.
//! \throws std::runtime_error if no entropy source is readable.
std::string generateUuid();

/*! Stable per-installation identifier attached to every sync payload.
 *  Created once, then read back from the same file on every start.
 */
class DeviceIdentity {
public:
    //! \throws PersistenceError if the file cannot be read or created.
    static DeviceIdentity loadOrCreate(const std::string &path);
    static DeviceIdentity fromValue(std::string id) { return DeviceIdentity(std::move(id)); }

    const std::string &id() const { return id_; }

private:
    explicit DeviceIdentity(std::string id) : id_(std::move(id)) {}

    std::string id_;
};

} // namespace hemascan
