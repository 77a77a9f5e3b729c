#pragma once

#include <string>

#include "hemascan/features.hpp"
#include "hemascan/transport.hpp"

namespace hemascan {

struct ModelConfig {
    std::string path;   //!< Empty means heuristic only.
    int input_size = ColorFeatureExtractor::kDefaultInputSize;
};

struct AnalysisConfig {
    int min_interval_ms = 500;
    int frame_skip = 3;
    std::string roi_preset = "lower_eyelid";
    RegionOfInterest roi = RegionOfInterest::lowerEyelid();
};

struct SyncConfig {
    int interval_sec = 6 * 60 * 60;
    std::string device_id_path = "hemascan.device_id";
};

struct StorageConfig {
    std::string scan_store_path = "hemascan.scans.json";
};

struct AppConfig {
    std::string version;
    std::string source_path;

    ModelConfig model;
    AnalysisConfig analysis;
    MqttSettings mqtt;
    SyncConfig sync;
    StorageConfig storage;

    //! \throws std::runtime_error naming the first offending value.
    void validate() const;
};

AppConfig loadConfig(const std::string &path);

} // namespace hemascan
