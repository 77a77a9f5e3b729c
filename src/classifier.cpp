#include "hemascan/classifier.hpp"

#include <stdexcept>

namespace hemascan {

Classification classify(double score)
{
    if (score >= kRedThreshold) {
        return {RiskLevel::RED,
                "Immediate medical consultation recommended. Signs suggest possible moderate to severe anemia."};
    }
    if (score >= kAmberThreshold) {
        return {RiskLevel::AMBER,
                "Consider scheduling a blood test. Some indicators of mild anemia detected."};
    }
    return {RiskLevel::GREEN, "No immediate concern detected. Continue regular health monitoring."};
}

std::string toString(RiskLevel level)
{
    switch (level) {
    case RiskLevel::RED: return "RED";
    case RiskLevel::AMBER: return "AMBER";
    default: return "GREEN";
    }
}

RiskLevel riskLevelFromString(const std::string &name)
{
    if (name == "RED") {
        return RiskLevel::RED;
    }
    if (name == "AMBER") {
        return RiskLevel::AMBER;
    }
    if (name == "GREEN") {
        return RiskLevel::GREEN;
    }
    throw std::invalid_argument("Unknown risk level: " + name);
}

} // namespace hemascan
