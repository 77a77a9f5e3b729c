#include <gtest/gtest.h>

#include "hemascan/diagnosis.hpp"
#include "hemascan/errors.hpp"

#include <stdexcept>

#include <opencv2/core.hpp>

using namespace hemascan;

namespace {

Raster solidRaster(cv::Scalar rgb)
{
    Raster raster;
    raster.pixels = cv::Mat(120, 160, CV_8UC3, rgb);
    return raster;
}

class ReadOnlyRepository : public InMemoryScanRepository {
protected:
    void persistLocked() override { throw PersistenceError("read-only filesystem"); }
};

} // namespace

TEST(DiagnosisService, HealthyCaptureIsGreen)
{
    ColorFeatureExtractor extractor(32);
    RiskInferenceEngine engine;
    DiagnosisService service(extractor, engine);

    DiagnosisResult result = service.diagnose(solidRaster(cv::Scalar(200, 60, 60)), RegionOfInterest::lowerEyelid());
    EXPECT_EQ(result.risk_level, RiskLevel::GREEN);
    EXPECT_DOUBLE_EQ(result.risk_score, 0.0);
    EXPECT_DOUBLE_EQ(result.confidence, kHeuristicConfidence);
    EXPECT_FALSE(result.model_used);
    EXPECT_EQ(result.recommendation, classify(0.0).recommendation);
}

TEST(DiagnosisService, VitalsRaiseTier)
{
    ColorFeatureExtractor extractor(32);
    RiskInferenceEngine engine;
    DiagnosisService service(extractor, engine);

    Vitals vitals;
    vitals.known_hemoglobin = 9.0;
    vitals.shortness_of_breath = true;
    vitals.pale_skin = true;
    vitals.dizziness = true;
    vitals.fatigue_level = 7;
    // 0.15 + 0.08 + 0.05 + 0.05 + 0.10
    DiagnosisResult result =
        service.diagnose(solidRaster(cv::Scalar(200, 60, 60)), RegionOfInterest::centerRegion(), vitals);
    EXPECT_NEAR(result.risk_score, 0.43, 1e-9);
    EXPECT_EQ(result.risk_level, RiskLevel::AMBER);
}

TEST(DiagnosisService, InvalidVitalsRejected)
{
    ColorFeatureExtractor extractor(32);
    RiskInferenceEngine engine;
    DiagnosisService service(extractor, engine);
    Vitals vitals;
    vitals.fatigue_level = 42;
    EXPECT_THROW(service.diagnose(solidRaster(cv::Scalar(1, 2, 3)), RegionOfInterest::fullFrame(), vitals),
                 std::invalid_argument);
}

TEST(DiagnosisService, PersistsPendingRecord)
{
    ColorFeatureExtractor extractor(32);
    RiskInferenceEngine engine;
    InMemoryScanRepository repo;
    DiagnosisService service(extractor, engine, &repo);

    Vitals vitals;
    vitals.known_hemoglobin = 6.2;
    DiagnosisResult result = service.runDiagnosis(solidRaster(cv::Scalar(128, 128, 128)),
                                                  RegionOfInterest::centerRegion(), "patient-9", ScanType::NAIL_BED,
                                                  vitals, "/captures/9.jpg");
    EXPECT_EQ(result.risk_level, RiskLevel::RED);

    auto pending = repo.listByStatus(SyncStatus::PENDING);
    ASSERT_EQ(pending.size(), 1u);
    const ScanRecord &record = pending.front();
    EXPECT_EQ(record.scan_id.size(), 36u);
    EXPECT_EQ(record.patient_id, "patient-9");
    EXPECT_EQ(record.scan_type, ScanType::NAIL_BED);
    EXPECT_EQ(record.local_image_path, "/captures/9.jpg");
    EXPECT_DOUBLE_EQ(record.risk_score, result.risk_score);
    EXPECT_GT(record.timestamp_ms, 0);
    EXPECT_EQ(record.feature_vector.find("6.2"), std::string::npos);
    EXPECT_TRUE(Json::parse(record.feature_vector).contains("pallor_index"));
}

TEST(DiagnosisService, StoreFailureIsSurfaced)
{
    ColorFeatureExtractor extractor(32);
    RiskInferenceEngine engine;
    ReadOnlyRepository repo;
    DiagnosisService service(extractor, engine, &repo);

    EXPECT_THROW(service.runDiagnosis(solidRaster(cv::Scalar(90, 90, 90)), RegionOfInterest::fullFrame(), "p",
                                      ScanType::EYE_CONJUNCTIVA, Vitals{}),
                 PersistenceError);
    EXPECT_EQ(repo.size(), 0u);

    DiagnosisService detached(extractor, engine);
    EXPECT_THROW(detached.runDiagnosis(solidRaster(cv::Scalar(90, 90, 90)), RegionOfInterest::fullFrame(), "p",
                                       ScanType::EYE_CONJUNCTIVA, Vitals{}),
                 PersistenceError);
}

TEST(DiagnosisService, DegenerateRoiIsCallerError)
{
    ColorFeatureExtractor extractor(32);
    RiskInferenceEngine engine;
    DiagnosisService service(extractor, engine);
    EXPECT_THROW(service.diagnose(solidRaster(cv::Scalar(90, 90, 90)), RegionOfInterest(0.5, 0.5, 0.5, 0.9)),
                 InvalidRoiError);
}
