#include "hemascan/transport.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include <mosquitto.h>

namespace hemascan {

std::string toString(TransportStatus status)
{
    switch (status) {
    case TransportStatus::Delivered: return "delivered";
    case TransportStatus::Cancelled: return "cancelled";
    default: return "failed";
    }
}

struct MqttTransport::Impl {
    explicit Impl(MqttSettings cfg) : settings(std::move(cfg))
    {
        if (settings.server.empty()) {
            throw std::invalid_argument("MQTT server address is empty");
        }
        if (settings.topic.empty()) {
            throw std::invalid_argument("MQTT sync topic is empty");
        }
        if (settings.username.empty() && !settings.password.empty()) {
            throw std::invalid_argument("MQTT password provided without username");
        }
        mosquitto_lib_init();
    }

    ~Impl()
    {
        mosquitto_lib_cleanup();
    }

    TransportStatus send(const std::string &payload, const CancellationToken &token)
    {
        // One sync cycle at a time owns the connection.
        std::lock_guard<std::mutex> lock(send_mutex);

        const char *client_id = settings.client_id.empty() ? nullptr : settings.client_id.c_str();
        std::unique_ptr<mosquitto, decltype(&mosquitto_destroy)> client(mosquitto_new(client_id, true, this),
                                                                        mosquitto_destroy);
        if (!client) {
            std::cerr << "[MQTT] Failed to create client" << std::endl;
            return TransportStatus::Failed;
        }
        mosquitto_connect_callback_set(client.get(), &Impl::onConnect);
        mosquitto_publish_callback_set(client.get(), &Impl::onPublish);

        if (!settings.username.empty()) {
            const char *password = settings.password.empty() ? nullptr : settings.password.c_str();
            int rc = mosquitto_username_pw_set(client.get(), settings.username.c_str(), password);
            if (rc != MOSQ_ERR_SUCCESS) {
                std::cerr << "[MQTT] Failed to set credentials: " << mosquitto_strerror(rc) << std::endl;
                return TransportStatus::Failed;
            }
        }

        connect_rc = -1;
        acked_mid = -1;
        int port = settings.port > 0 ? settings.port : 1883;
        int rc = mosquitto_connect(client.get(), settings.server.c_str(), port, settings.keep_alive);
        if (rc != MOSQ_ERR_SUCCESS) {
            std::cerr << "[MQTT] Failed to connect to " << settings.server << ":" << port << ": "
                      << mosquitto_strerror(rc) << std::endl;
            return TransportStatus::Failed;
        }

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(settings.timeout_ms);
        auto expired = [&deadline]() { return std::chrono::steady_clock::now() >= deadline; };

        TransportStatus status = waitFor(client.get(), token, expired, [this]() { return connect_rc >= 0; });
        if (status != TransportStatus::Delivered) {
            mosquitto_disconnect(client.get());
            return status;
        }
        if (connect_rc != 0) {
            std::cerr << "[MQTT] Broker refused connection: " << mosquitto_connack_string(connect_rc) << std::endl;
            return TransportStatus::Failed;
        }

        int mid = 0;
        rc = mosquitto_publish(client.get(), &mid, settings.topic.c_str(), static_cast<int>(payload.size()),
                               payload.data(), 1, false);
        if (rc != MOSQ_ERR_SUCCESS) {
            std::cerr << "[MQTT] Failed to publish sync batch: " << mosquitto_strerror(rc) << std::endl;
            mosquitto_disconnect(client.get());
            return TransportStatus::Failed;
        }

        status = waitFor(client.get(), token, expired, [this, mid]() { return acked_mid == mid; });
        mosquitto_disconnect(client.get());
        if (status == TransportStatus::Delivered) {
            std::cout << "[MQTT] Sync batch acknowledged on " << settings.topic << " (" << payload.size()
                      << " bytes)" << std::endl;
        }
        return status;
    }

    template <typename Expired, typename Done>
    TransportStatus waitFor(mosquitto *client, const CancellationToken &token, Expired expired, Done done)
    {
        while (!done()) {
            if (token.cancelled()) {
                std::cerr << "[MQTT] Send cancelled" << std::endl;
                return TransportStatus::Cancelled;
            }
            if (expired()) {
                std::cerr << "[MQTT] Timed out after " << settings.timeout_ms << " ms" << std::endl;
                return TransportStatus::Failed;
            }
            int rc = mosquitto_loop(client, 100, 1);
            if (rc != MOSQ_ERR_SUCCESS) {
                std::cerr << "[MQTT] Loop error: " << mosquitto_strerror(rc) << std::endl;
                return TransportStatus::Failed;
            }
        }
        return TransportStatus::Delivered;
    }

    static void onConnect(struct mosquitto *mosq, void *userdata, int rc)
    {
        (void)mosq;
        auto *self = static_cast<Impl *>(userdata);
        if (self) {
            self->connect_rc = rc;
        }
    }

    static void onPublish(struct mosquitto *mosq, void *userdata, int mid)
    {
        (void)mosq;
        auto *self = static_cast<Impl *>(userdata);
        if (self) {
            self->acked_mid = mid;
        }
    }

    MqttSettings settings;
    std::mutex send_mutex;
    int connect_rc = -1;
    int acked_mid = -1;
};

MqttTransport::MqttTransport(MqttSettings settings) : impl_(std::make_unique<Impl>(std::move(settings))) {}

MqttTransport::~MqttTransport() = default;

TransportStatus MqttTransport::send(const std::string &payload, const CancellationToken &token)
{
    return impl_->send(payload, token);
}

} // namespace hemascan
