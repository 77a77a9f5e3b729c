#pragma once

#include <string>

namespace hemascan {

enum class RiskLevel { RED, AMBER, GREEN };

struct Classification {
    RiskLevel level = RiskLevel::GREEN;
    std::string recommendation;
};

constexpr double kRedThreshold = 0.70;
constexpr double kAmberThreshold = 0.40;

//! Lower bound of each tier is inclusive: 0.70 is RED, 0.40 is AMBER.
Classification classify(double score);

std::string toString(RiskLevel level);

//! \throws std::invalid_argument on an unknown name.
RiskLevel riskLevelFromString(const std::string &name);

} // namespace hemascan
