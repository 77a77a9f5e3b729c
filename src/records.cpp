#include "hemascan/records.hpp"

#include <stdexcept>

namespace hemascan {

std::string toString(ScanType type)
{
    return type == ScanType::NAIL_BED ? "NAIL_BED" : "EYE_CONJUNCTIVA";
}

std::string toString(SyncStatus status)
{
    switch (status) {
    case SyncStatus::SYNCED: return "SYNCED";
    case SyncStatus::FAILED: return "FAILED";
    default: return "PENDING";
    }
}

ScanType scanTypeFromString(const std::string &name)
{
    if (name == "EYE_CONJUNCTIVA" || name == "conjunctiva") {
        return ScanType::EYE_CONJUNCTIVA;
    }
    if (name == "NAIL_BED" || name == "nail_bed") {
        return ScanType::NAIL_BED;
    }
    throw std::invalid_argument("Unknown scan type: " + name);
}

SyncStatus syncStatusFromString(const std::string &name)
{
    if (name == "PENDING") {
        return SyncStatus::PENDING;
    }
    if (name == "SYNCED") {
        return SyncStatus::SYNCED;
    }
    if (name == "FAILED") {
        return SyncStatus::FAILED;
    }
    throw std::invalid_argument("Unknown sync status: " + name);
}

std::string encodeFeatureVector(const ColorFeatures &features, const Vitals &vitals)
{
    Json root = makeObject();
    root["pallor_index"] = features.pallor_index;
    root["saturation"] = features.saturation;
    root["brightness"] = features.brightness;
    root["red_ratio"] = features.redRatio();
    root["has_fatigue"] = vitals.hasFatigue();
    root["has_shortness_of_breath"] = vitals.shortness_of_breath;
    root["has_dizziness"] = vitals.dizziness;
    root["has_pale_skin"] = vitals.pale_skin;
    return root.dump();
}

Json recordToJson(const ScanRecord &record)
{
    Json obj = makeObject();
    obj["scan_id"] = record.scan_id;
    obj["patient_id"] = record.patient_id;
    obj["scan_type"] = toString(record.scan_type);
    obj["local_image_path"] = record.local_image_path;

    Json vitals = makeObject();
    vitals["fatigue_level"] = record.vitals.fatigue_level ? Json(*record.vitals.fatigue_level) : Json(nullptr);
    vitals["known_hemoglobin"] =
        record.vitals.known_hemoglobin ? Json(*record.vitals.known_hemoglobin) : Json(nullptr);
    vitals["shortness_of_breath"] = record.vitals.shortness_of_breath;
    vitals["pale_skin"] = record.vitals.pale_skin;
    vitals["dizziness"] = record.vitals.dizziness;
    obj["vitals"] = vitals;

    obj["risk_score"] = record.risk_score;
    obj["risk_level"] = toString(record.risk_level);
    obj["confidence"] = record.confidence;
    obj["inference_time_ms"] = record.inference_time_ms;
    obj["feature_vector"] = record.feature_vector;
    obj["sync_status"] = toString(record.sync_status);
    obj["timestamp"] = record.timestamp_ms;
    return obj;
}

ScanRecord recordFromJson(const Json &value)
{
    if (!value.is_object()) {
        throw std::runtime_error("Scan record must be a JSON object");
    }
    ScanRecord record;
    record.scan_id = value.get_string("scan_id");
    if (record.scan_id.empty()) {
        throw std::runtime_error("Scan record missing 'scan_id'");
    }
    record.patient_id = value.get_string("patient_id");
    record.scan_type = scanTypeFromString(value.get_string("scan_type", "EYE_CONJUNCTIVA"));
    record.local_image_path = value.get_string("local_image_path");

    if (value.contains("vitals") && value["vitals"].is_object()) {
        const Json &vitals = value["vitals"];
        if (vitals.contains("fatigue_level") && vitals["fatigue_level"].is_number()) {
            record.vitals.fatigue_level = static_cast<int>(vitals["fatigue_level"].as_number());
        }
        if (vitals.contains("known_hemoglobin") && vitals["known_hemoglobin"].is_number()) {
            record.vitals.known_hemoglobin = vitals["known_hemoglobin"].as_number();
        }
        record.vitals.shortness_of_breath = vitals.get_bool("shortness_of_breath");
        record.vitals.pale_skin = vitals.get_bool("pale_skin");
        record.vitals.dizziness = vitals.get_bool("dizziness");
    }

    record.risk_score = value.get_number("risk_score");
    record.risk_level = riskLevelFromString(value.get_string("risk_level", "GREEN"));
    record.confidence = value.get_number("confidence");
    record.inference_time_ms = static_cast<std::int64_t>(value.get_number("inference_time_ms"));
    record.feature_vector = value.get_string("feature_vector");
    record.sync_status = syncStatusFromString(value.get_string("sync_status", "PENDING"));
    record.timestamp_ms = static_cast<std::int64_t>(value.get_number("timestamp"));
    return record;
}

} // namespace hemascan
