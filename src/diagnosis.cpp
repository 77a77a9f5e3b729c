#include "hemascan/diagnosis.hpp"

#include "hemascan/classifier.hpp"
#include "hemascan/device_identity.hpp"
#include "hemascan/errors.hpp"

#include <iostream>
#include <utility>

namespace hemascan {

DiagnosisService::DiagnosisService(const ColorFeatureExtractor &extractor, const RiskInferenceEngine &engine,
                                   ScanRepository *repository)
    : extractor_(extractor), engine_(engine), repository_(repository)
{
}

DiagnosisResult DiagnosisService::diagnose(Raster &&raster, const RegionOfInterest &roi,
                                           const std::optional<Vitals> &vitals) const
{
    if (vitals) {
        vitals->validate();
    }

    ExtractedRegion region = extractor_.extract(std::move(raster), roi);
    InferenceOutcome outcome = engine_.analyze(region.scaled, region.features);

    double adjusted = adjustForVitals(outcome.risk_score, vitals);
    Classification tier = classify(adjusted);

    DiagnosisResult result;
    result.risk_score = adjusted;
    result.risk_level = tier.level;
    result.confidence = outcome.confidence;
    result.inference_time_ms = outcome.inference_time_ms;
    result.features = region.features;
    result.recommendation = std::move(tier.recommendation);
    result.model_used = outcome.model_used;
    return result;
}

DiagnosisResult DiagnosisService::runDiagnosis(Raster &&raster, const RegionOfInterest &roi,
                                               const std::string &patient_id, ScanType scan_type,
                                               const Vitals &vitals, const std::string &local_image_path) const
{
    if (!repository_) {
        throw PersistenceError("No scan store configured");
    }

    DiagnosisResult result = diagnose(std::move(raster), roi, vitals);

    ScanRecord record;
    record.scan_id = generateUuid();
    record.patient_id = patient_id;
    record.scan_type = scan_type;
    record.local_image_path = local_image_path;
    record.vitals = vitals;
    record.risk_score = result.risk_score;
    record.risk_level = result.risk_level;
    record.confidence = result.confidence;
    record.inference_time_ms = result.inference_time_ms;
    record.feature_vector = encodeFeatureVector(result.features, vitals);
    record.sync_status = SyncStatus::PENDING;
    record.timestamp_ms = currentEpochMillis();

    try {
        repository_->insert(record);
    } catch (const PersistenceError &) {
        throw;
    } catch (const std::exception &ex) {
        throw PersistenceError(std::string("Failed to store scan: ") + ex.what());
    }
    std::cout << "[STORE] Saved scan " << record.scan_id << " (" << toString(result.risk_level) << ")"
              << std::endl;
    return result;
}

Json toJson(const DiagnosisResult &result)
{
    Json obj = makeObject();
    obj["risk_score"] = result.risk_score;
    obj["risk_level"] = toString(result.risk_level);
    obj["confidence"] = result.confidence;
    obj["inference_time_ms"] = result.inference_time_ms;
    obj["recommendation"] = result.recommendation;
    obj["model_used"] = result.model_used;

    Json features = makeObject();
    features["mean_red"] = result.features.mean_red;
    features["mean_green"] = result.features.mean_green;
    features["mean_blue"] = result.features.mean_blue;
    features["saturation"] = result.features.saturation;
    features["brightness"] = result.features.brightness;
    features["pallor_index"] = result.features.pallor_index;
    features["red_ratio"] = result.features.redRatio();
    obj["features"] = std::move(features);
    return obj;
}

} // namespace hemascan
