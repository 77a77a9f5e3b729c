#pragma once

#include "hemascan/classifier.hpp"
#include "hemascan/features.hpp"
#include "hemascan/json.hpp"
#include "hemascan/vitals.hpp"

#include <cstdint>
#include <string>

namespace hemascan {

enum class ScanType { EYE_CONJUNCTIVA, NAIL_BED };

enum class SyncStatus { PENDING, SYNCED, FAILED };

std::string toString(ScanType type);
std::string toString(SyncStatus status);
//! \throws std::invalid_argument on an unknown name.
ScanType scanTypeFromString(const std::string &name);
//! \throws std::invalid_argument on an unknown name.
SyncStatus syncStatusFromString(const std::string &name);

struct DiagnosisResult {
    double risk_score = 0.0;
    RiskLevel risk_level = RiskLevel::GREEN;
    double confidence = 0.0;
    std::int64_t inference_time_ms = 0;
    ColorFeatures features;
    std::string recommendation;
    bool model_used = false;
};

struct ScanRecord {
    std::string scan_id;
    std::string patient_id;
    ScanType scan_type = ScanType::EYE_CONJUNCTIVA;
    std::string local_image_path; //!< Never leaves the device.
    Vitals vitals;
    double risk_score = 0.0;
    RiskLevel risk_level = RiskLevel::GREEN;
    double confidence = 0.0;
    std::int64_t inference_time_ms = 0;
    std::string feature_vector;   //!< Anonymised JSON, see encodeFeatureVector().
    SyncStatus sync_status = SyncStatus::PENDING;
    std::int64_t timestamp_ms = 0;
};

/*! Anonymised features eligible for sync: colour statistics plus coarse vitals flags.
 *  Hemoglobin and the raw fatigue level are never included.
 */
std::string encodeFeatureVector(const ColorFeatures &features, const Vitals &vitals);

//! Full local representation, used by the file-backed store.
Json recordToJson(const ScanRecord &record);
ScanRecord recordFromJson(const Json &value);

} // namespace hemascan
