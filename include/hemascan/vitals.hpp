#pragma once

#include <optional>

namespace hemascan {

/*! Patient-reported vitals. An unset optional means "not assessed", never "normal". */
struct Vitals {
    std::optional<int> fatigue_level;        //!< 1-10
    std::optional<double> known_hemoglobin;  //!< g/dL
    bool shortness_of_breath = false;
    bool pale_skin = false;
    bool dizziness = false;

    //! \throws std::invalid_argument if a present value is out of range.
    void validate() const;

    bool hasFatigue() const { return fatigue_level && *fatigue_level >= 5; }
};

/*! Provisional clinical corrections, not calibrated against outcome data.
 *  Increments are summed and the total is clamped to [0,1] once.
 *  Returns base_score unchanged when vitals is empty.
 */
double adjustForVitals(double base_score, const std::optional<Vitals> &vitals);

} // namespace hemascan
