#pragma once

#include "core/ReflectSerializer.h"
#include "core/Result.h"
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace LanderSim {

/**
 * Physical constants of the descent, fixed when a simulator is constructed.
 *
 * Units follow the 1969 game: miles, seconds, pounds. Gravity is lunar surface gravity in
 * miles/sec^2; thrust is expressed per pound of propellant burned.
 */
struct LanderConstants {
    double gravity = 0.001;
    double dryMassLbs = 16500.0;
    double thrustPerPoundOfFuel = 1.8;
    double fullTankFuelLbs = 16000.0;
    double turnLengthSec = 10.0;
    double minBurnRateLbsPerSec = 8.0;
    double maxBurnRateLbsPerSec = 200.0;

    double initialAltitudeMiles = 120.0;
    double initialDownwardSpeedMilesPerSec = 1.0;

    double milesPerSecToMph = 3600.0;
    double epsilon = 0.001;
};

// Lowest burn altitude from which a sustained maximum burn can still arrest the descent.
// At 38 miles even a constant 200 lbs/sec burn leaves a crater.
inline constexpr double kMinimumRecoverableBurnAltitudeMiles = 48.0;

Result<std::monostate, std::string> validateLanderConstants(const LanderConstants& constants);

inline void to_json(nlohmann::json& j, const LanderConstants& constants)
{
    j = ReflectSerializer::to_json(constants);
}

inline void from_json(const nlohmann::json& j, LanderConstants& constants)
{
    constants = ReflectSerializer::from_json<LanderConstants>(j);
}

} // namespace LanderSim
