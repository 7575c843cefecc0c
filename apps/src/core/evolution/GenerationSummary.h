#pragma once

#include "core/lander/LandingOutcome.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace LanderSim {

/**
 * What the trainer reports when the best score improves. The burn history is the exact
 * sequence of per-turn burn rates, so typing it into the manual game reproduces the landing.
 */
struct GenerationSummary {
    int generationIndex = 0;
    int64_t bestScore = 0;
    double bestImpactSpeedMph = 0.0;
    double bestFuelRemainingLbs = 0.0;
    std::vector<double> bestBurnHistory;
    LandingRating bestRating = LandingRating::Fatal;
    std::optional<std::string> symbolicFormula;

    nlohmann::json toJson() const;
};

/**
 * Per-generation statistics, computed for every generation whether or not it improved.
 */
struct GenerationStats {
    int generation = 0;
    int64_t bestScore = 0;
    int64_t worstScore = 0;
    double averageScore = 0.0;
    int landedCount = 0; // Impact speed within the crash-survivable limit.
    int bestMemberId = -1;
};

} // namespace LanderSim
