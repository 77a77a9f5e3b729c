#include <gtest/gtest.h>

#include "hemascan/records.hpp"

using namespace hemascan;

namespace {

ColorFeatures sampleFeatures()
{
    ColorFeatures f;
    f.mean_red = 50;
    f.mean_green = 80;
    f.mean_blue = 90;
    f.saturation = 0.15;
    f.brightness = 0.35;
    f.pallor_index = pallorIndex(50, 80, 90, 0.15);
    return f;
}

} // namespace

TEST(FeatureVector, ContainsOnlyAnonymisedFields)
{
    Vitals vitals;
    vitals.fatigue_level = 6;
    vitals.known_hemoglobin = 8.4;
    vitals.dizziness = true;

    Json vector = Json::parse(encodeFeatureVector(sampleFeatures(), vitals));
    ASSERT_TRUE(vector.is_object());
    EXPECT_EQ(vector.as_object().size(), 8u);
    EXPECT_NEAR(vector["pallor_index"].as_number(), 0.5391, 1e-3);
    EXPECT_NEAR(vector["red_ratio"].as_number(), 0.2174, 1e-3);
    EXPECT_DOUBLE_EQ(vector["saturation"].as_number(), 0.15);
    EXPECT_TRUE(vector["has_fatigue"].as_bool());
    EXPECT_FALSE(vector["has_shortness_of_breath"].as_bool());
    EXPECT_TRUE(vector["has_dizziness"].as_bool());
    EXPECT_FALSE(vector["has_pale_skin"].as_bool());
    EXPECT_FALSE(vector.contains("known_hemoglobin"));
    EXPECT_FALSE(vector.contains("fatigue_level"));
}

TEST(ScanRecordJson, PreservesLocalFields)
{
    ScanRecord record;
    record.scan_id = "scan-1";
    record.patient_id = "patient-7";
    record.scan_type = ScanType::NAIL_BED;
    record.local_image_path = "/data/img/1.jpg";
    record.vitals.known_hemoglobin = 9.5;
    record.vitals.pale_skin = true;
    record.risk_score = 0.55;
    record.risk_level = RiskLevel::AMBER;
    record.confidence = 0.65;
    record.inference_time_ms = 12;
    record.feature_vector = encodeFeatureVector(sampleFeatures(), record.vitals);
    record.sync_status = SyncStatus::FAILED;
    record.timestamp_ms = 1700000000123;

    ScanRecord copy = recordFromJson(Json::parse(recordToJson(record).dump()));
    EXPECT_EQ(copy.scan_id, "scan-1");
    EXPECT_EQ(copy.patient_id, "patient-7");
    EXPECT_EQ(copy.scan_type, ScanType::NAIL_BED);
    EXPECT_EQ(copy.local_image_path, "/data/img/1.jpg");
    ASSERT_TRUE(copy.vitals.known_hemoglobin.has_value());
    EXPECT_DOUBLE_EQ(*copy.vitals.known_hemoglobin, 9.5);
    EXPECT_FALSE(copy.vitals.fatigue_level.has_value());
    EXPECT_TRUE(copy.vitals.pale_skin);
    EXPECT_EQ(copy.risk_level, RiskLevel::AMBER);
    EXPECT_EQ(copy.sync_status, SyncStatus::FAILED);
    EXPECT_EQ(copy.timestamp_ms, 1700000000123);
    EXPECT_EQ(copy.feature_vector, record.feature_vector);
}

TEST(ScanRecordJson, RejectsRecordWithoutId)
{
    EXPECT_THROW(recordFromJson(Json::parse("{\"patient_id\":\"p\"}")), std::runtime_error);
}

TEST(ScanTypeNames, AcceptsCliAliases)
{
    EXPECT_EQ(scanTypeFromString("conjunctiva"), ScanType::EYE_CONJUNCTIVA);
    EXPECT_EQ(scanTypeFromString("NAIL_BED"), ScanType::NAIL_BED);
    EXPECT_EQ(toString(ScanType::EYE_CONJUNCTIVA), "EYE_CONJUNCTIVA");
    EXPECT_THROW(scanTypeFromString("retina"), std::invalid_argument);
}
