#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace hemascan {

/*! Cooperative cancellation for one sync cycle.
 *  Cancelled when cancel() was called or when the abort predicate reports that
 *  the run constraints no longer hold.
 */
class CancellationToken {
public:
    CancellationToken() = default;
    explicit CancellationToken(std::function<bool()> abort_when) : abort_when_(std::move(abort_when)) {}

    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load() || (abort_when_ && abort_when_()); }

private:
    std::atomic<bool> cancelled_{false};
    std::function<bool()> abort_when_;
};

enum class TransportStatus { Delivered, Failed, Cancelled };

std::string toString(TransportStatus status);

/*! Network side of the sync queue. send() blocks until the payload is accepted,
 *  rejected, timed out, or the token is cancelled.
 */
class SyncTransport {
public:
    virtual ~SyncTransport() = default;

    virtual TransportStatus send(const std::string &payload, const CancellationToken &token) = 0;
};

struct MqttSettings {
    std::string server;
    int port = 1883;
    std::string client_id;
    std::string topic = "hemascan/sync";
    std::string username;
    std::string password;
    int keep_alive = 60;
    int timeout_ms = 10000;
};

/*! Publishes each batch at QoS 1 and waits for the broker acknowledgement. */
class MqttTransport : public SyncTransport {
public:
    explicit MqttTransport(MqttSettings settings);
    ~MqttTransport() override;

    TransportStatus send(const std::string &payload, const CancellationToken &token) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace hemascan
