#include "hemascan/config.hpp"

#include "hemascan/json.hpp"

#include <filesystem>
#include <stdexcept>

namespace hemascan {
namespace {

std::string resolvePath(const std::string &value, const std::filesystem::path &baseDir)
{
    if (value.empty()) {
        return value;
    }
    std::filesystem::path path(value);
    if (!path.is_absolute()) {
        path = baseDir / path;
    }
    return path.lexically_normal().generic_string();
}

RegionOfInterest parseRoi(const Json &value)
{
    if (value.is_string()) {
        return RegionOfInterest::fromPreset(value.as_string());
    }
    if (value.is_array()) {
        const auto &bounds = value.as_array();
        if (bounds.size() != 4) {
            throw std::runtime_error("analysis.roi must have 4 values [left, top, right, bottom]");
        }
        return RegionOfInterest(bounds[0].as_number(), bounds[1].as_number(), bounds[2].as_number(),
                                bounds[3].as_number());
    }
    throw std::runtime_error("analysis.roi must be a preset name or an array");
}

}  // namespace

void AppConfig::validate() const
{
    if (model.input_size <= 0) {
        throw std::runtime_error("model.input_size must be positive");
    }
    if (analysis.min_interval_ms < 0) {
        throw std::runtime_error("analysis.min_interval_ms must not be negative");
    }
    if (analysis.frame_skip < 1) {
        throw std::runtime_error("analysis.frame_skip must be at least 1");
    }
    if (!analysis.roi.isValid()) {
        throw std::runtime_error("analysis.roi is empty");
    }
    if (mqtt.port <= 0 || mqtt.port > 65535) {
        throw std::runtime_error("mqtt.port out of range");
    }
    if (mqtt.timeout_ms <= 0) {
        throw std::runtime_error("mqtt.timeout_ms must be positive");
    }
    if (sync.interval_sec <= 0) {
        throw std::runtime_error("sync.interval_sec must be positive");
    }
    if (sync.device_id_path.empty()) {
        throw std::runtime_error("sync.device_id_path is empty");
    }
    if (storage.scan_store_path.empty()) {
        throw std::runtime_error("storage.scan_store_path is empty");
    }
}

AppConfig loadConfig(const std::string &path)
{
    Json root = Json::parse_file(path);
    if (!root.is_object()) {
        throw std::runtime_error("Configuration must be a JSON object: " + path);
    }

    std::filesystem::path configPath(path);
    std::filesystem::path absoluteConfigPath = std::filesystem::absolute(configPath).lexically_normal();
    std::filesystem::path baseDir = absoluteConfigPath.has_parent_path() ? absoluteConfigPath.parent_path()
                                                                       : std::filesystem::path(".");

    AppConfig config;
    config.source_path = absoluteConfigPath.generic_string();
    config.version = root.get_string("version");

    if (root.contains("model")) {
        const auto &model = root["model"];
        config.model.path = resolvePath(model.get_string("path"), baseDir);
        config.model.input_size = static_cast<int>(model.get_number("input_size", config.model.input_size));
    }

    if (root.contains("analysis")) {
        const auto &analysis = root["analysis"];
        config.analysis.min_interval_ms =
            static_cast<int>(analysis.get_number("min_interval_ms", config.analysis.min_interval_ms));
        config.analysis.frame_skip = static_cast<int>(analysis.get_number("frame_skip", config.analysis.frame_skip));
        if (analysis.contains("roi")) {
            const auto &roi = analysis["roi"];
            config.analysis.roi = parseRoi(roi);
            config.analysis.roi_preset = roi.is_string() ? roi.as_string() : "custom";
        }
    }

    if (!root.contains("mqtt")) {
        throw std::runtime_error("Configuration missing 'mqtt' section");
    }
    const auto &mqtt = root["mqtt"];
    config.mqtt.server = mqtt.get_string("server");
    config.mqtt.port = static_cast<int>(mqtt.get_number("port", 1883));
    config.mqtt.client_id = mqtt.get_string("client_id");
    config.mqtt.topic = mqtt.get_string("topic", config.mqtt.topic);
    config.mqtt.username = mqtt.get_string("username");
    config.mqtt.password = mqtt.get_string("password");
    config.mqtt.timeout_ms = static_cast<int>(mqtt.get_number("timeout_ms", config.mqtt.timeout_ms));
    config.mqtt.keep_alive = static_cast<int>(mqtt.get_number("keep_alive", config.mqtt.keep_alive));
    if (config.mqtt.server.empty()) {
        throw std::runtime_error("Configuration missing 'mqtt.server'");
    }

    if (root.contains("sync")) {
        const auto &sync = root["sync"];
        config.sync.interval_sec = static_cast<int>(sync.get_number("interval_sec", config.sync.interval_sec));
        config.sync.device_id_path = sync.get_string("device_id_path", config.sync.device_id_path);
    }
    config.sync.device_id_path = resolvePath(config.sync.device_id_path, baseDir);

    if (!root.contains("storage")) {
        throw std::runtime_error("Configuration missing 'storage' section");
    }
    config.storage.scan_store_path =
        resolvePath(root["storage"].get_string("scan_store_path", config.storage.scan_store_path), baseDir);

    config.validate();
    return config;
}

} // namespace hemascan
