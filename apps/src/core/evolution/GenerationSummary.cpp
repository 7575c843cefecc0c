#include "GenerationSummary.h"

namespace LanderSim {

nlohmann::json GenerationSummary::toJson() const
{
    nlohmann::json j;
    j["generationIndex"] = generationIndex;
    j["bestScore"] = bestScore;
    j["bestImpactSpeedMph"] = bestImpactSpeedMph;
    j["bestFuelRemainingLbs"] = bestFuelRemainingLbs;
    j["bestBurnHistory"] = bestBurnHistory;
    j["bestRating"] = toString(bestRating);
    if (symbolicFormula.has_value()) {
        j["symbolicFormula"] = *symbolicFormula;
    }
    return j;
}

} // namespace LanderSim
