#pragma once

#include "hemascan/common.hpp"
#include "hemascan/features.hpp"
#include "hemascan/inference.hpp"
#include "hemascan/records.hpp"
#include "hemascan/repository.hpp"
#include "hemascan/vitals.hpp"

#include <optional>
#include <string>

namespace hemascan {

/*! Full screening pass: crop, colour features, risk inference, vitals correction,
 *  tier classification. runDiagnosis() also persists the scan as PENDING sync.
 */
class DiagnosisService {
public:
    DiagnosisService(const ColorFeatureExtractor &extractor, const RiskInferenceEngine &engine,
                     ScanRepository *repository = nullptr);

    //! \throws InvalidRoiError, DecodeError
    DiagnosisResult diagnose(Raster &&raster, const RegionOfInterest &roi,
                             const std::optional<Vitals> &vitals = std::nullopt) const;

    //! The diagnosis is complete only once stored.
    //! \throws InvalidRoiError, DecodeError, PersistenceError
    DiagnosisResult runDiagnosis(Raster &&raster, const RegionOfInterest &roi, const std::string &patient_id,
                                 ScanType scan_type, const Vitals &vitals,
                                 const std::string &local_image_path = {}) const;

private:
    const ColorFeatureExtractor &extractor_;
    const RiskInferenceEngine &engine_;
    ScanRepository *repository_;
};

Json toJson(const DiagnosisResult &result);

} // namespace hemascan
