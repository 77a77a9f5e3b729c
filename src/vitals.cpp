#include "hemascan/vitals.hpp"
#include "hemascan/common.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace hemascan {

namespace {

// Adjusted scores are kept to six decimals.
constexpr double kScoreScale = 1e6;

} // namespace

void Vitals::validate() const
{
    if (fatigue_level && (*fatigue_level < 1 || *fatigue_level > 10)) {
        throw std::invalid_argument("Fatigue level must be between 1 and 10, got " + std::to_string(*fatigue_level));
    }
    if (known_hemoglobin && (!std::isfinite(*known_hemoglobin) || *known_hemoglobin <= 0.0)) {
        throw std::invalid_argument("Known hemoglobin must be a positive g/dL value");
    }
}

double adjustForVitals(double base_score, const std::optional<Vitals> &vitals)
{
    if (!vitals) {
        return base_score;
    }

    // Increments in hundredths, so tier boundaries (0.40, 0.70) are hit exactly.
    int delta = 0;

    if (vitals->known_hemoglobin) {
        const double hb = *vitals->known_hemoglobin;
        if (hb < 7.0) {
            delta += 30;
        } else if (hb < 10.0) {
            delta += 15;
        } else if (hb < 12.0) {
            delta += 5;
        }
    }

    if (vitals->fatigue_level) {
        if (*vitals->fatigue_level >= 7) {
            delta += 10;
        } else if (*vitals->fatigue_level >= 5) {
            delta += 5;
        }
    }

    if (vitals->shortness_of_breath) {
        delta += 8;
    }
    if (vitals->dizziness) {
        delta += 5;
    }
    if (vitals->pale_skin) {
        delta += 5;
    }

    if (delta == 0) {
        return clampUnit(base_score);
    }
    const double adjusted = base_score + delta / 100.0;
    return clampUnit(std::round(adjusted * kScoreScale) / kScoreScale);
}

} // namespace hemascan
