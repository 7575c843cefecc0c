#pragma once

#include "core/ReflectSerializer.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace LanderSim {

/**
 * Storer's landing ratings, in increasing order of severity. Each category covers impact
 * speeds up to and including its threshold.
 */
enum class LandingRating : uint8_t {
    Perfect = 0,         // <= 1 mph
    Good = 1,            // <= 10 mph
    Poor = 2,            // <= 22 mph
    Damaged = 3,         // <= 40 mph
    CrashSurvivable = 4, // <= 60 mph
    Fatal = 5,
};

LandingRating rateLanding(double impactSpeedMph);
const char* toString(LandingRating rating);

// Rating text; fatal impacts also report the depth of the new crater.
std::string describeLanding(double impactSpeedMph);

double craterDepthFeet(double impactSpeedMph);

// How a descent reached the surface.
enum class TerminalBranch : uint8_t {
    BallisticFuelOut = 0, // Propellant exhausted, free fall to the surface.
    FinalApproach = 1,    // Surface reached under the last commanded burn.
    FreeFall = 2,         // Final approach with the engine off.
};

const char* toString(TerminalBranch branch);

struct DescentOutcome {
    double impactSpeedMph = 0.0;
    double fuelRemainingLbs = 0.0;
    double elapsedTimeSec = 0.0;
    TerminalBranch terminalBranch = TerminalBranch::FinalApproach;
    std::optional<double> fuelOutTimeSec;
    int velocityReversalCorrections = 0;
    std::vector<double> burnHistory;

    LandingRating rating() const { return rateLanding(impactSpeedMph); }
};

struct ScoringConfig {
    double speedCeilingMph = 40.0;     // No credit for softness above this impact speed.
    double acceptableImpactMph = 0.0;  // Softer landings score as if they hit at this speed.
    double scoreMultiplier = 100000.0; // Keeps the fuel bonus a tiebreaker.
    double fuelBonusPoints = 100.0;    // Bonus for a full tank left over.
};

/**
 * Trainer fitness. Softness dominates; leftover fuel adds up to fuelBonusPoints on a
 * landing that scores above zero, and is subtracted when the base score is zero or
 * negative so a crash never profits from unburned propellant.
 */
int64_t computeFitnessScore(
    double impactSpeedMph,
    double fuelRemainingLbs,
    double fullTankFuelLbs,
    const ScoringConfig& config);

inline void to_json(nlohmann::json& j, const ScoringConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, ScoringConfig& config)
{
    config = ReflectSerializer::from_json<ScoringConfig>(j);
}

} // namespace LanderSim
