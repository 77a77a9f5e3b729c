#include <gtest/gtest.h>

#include "hemascan/classifier.hpp"

using namespace hemascan;

TEST(Classify, BoundariesAreInclusive)
{
    EXPECT_EQ(classify(0.70).level, RiskLevel::RED);
    EXPECT_EQ(classify(0.6999).level, RiskLevel::AMBER);
    EXPECT_EQ(classify(0.40).level, RiskLevel::AMBER);
    EXPECT_EQ(classify(0.3999).level, RiskLevel::GREEN);
    EXPECT_EQ(classify(0.0).level, RiskLevel::GREEN);
    EXPECT_EQ(classify(1.0).level, RiskLevel::RED);
}

TEST(Classify, RecommendationPerTier)
{
    EXPECT_EQ(classify(0.9).recommendation,
              "Immediate medical consultation recommended. Signs suggest possible moderate to severe anemia.");
    EXPECT_EQ(classify(0.5).recommendation,
              "Consider scheduling a blood test. Some indicators of mild anemia detected.");
    EXPECT_EQ(classify(0.1).recommendation, "No immediate concern detected. Continue regular health monitoring.");
}

TEST(RiskLevelNames, RoundTrip)
{
    for (RiskLevel level : {RiskLevel::RED, RiskLevel::AMBER, RiskLevel::GREEN}) {
        EXPECT_EQ(riskLevelFromString(toString(level)), level);
    }
    EXPECT_THROW(riskLevelFromString("ORANGE"), std::invalid_argument);
}
