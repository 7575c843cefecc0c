#include "LandingOutcome.h"

#include <cmath>
#include <limits>
#include <spdlog/fmt/fmt.h>

namespace LanderSim {

LandingRating rateLanding(double impactSpeedMph)
{
    if (impactSpeedMph <= 1.0) {
        return LandingRating::Perfect;
    }
    if (impactSpeedMph <= 10.0) {
        return LandingRating::Good;
    }
    if (impactSpeedMph <= 22.0) {
        return LandingRating::Poor;
    }
    if (impactSpeedMph <= 40.0) {
        return LandingRating::Damaged;
    }
    if (impactSpeedMph <= 60.0) {
        return LandingRating::CrashSurvivable;
    }
    return LandingRating::Fatal;
}

const char* toString(LandingRating rating)
{
    switch (rating) {
        case LandingRating::Perfect:
            return "PERFECT LANDING !-(LUCKY)";
        case LandingRating::Good:
            return "GOOD LANDING-(COULD BE BETTER)";
        case LandingRating::Poor:
            return "CONGRATULATIONS ON A POOR LANDING";
        case LandingRating::Damaged:
            return "CRAFT DAMAGE. GOOD LUCK";
        case LandingRating::CrashSurvivable:
            return "CRASH LANDING-YOU'VE 5 HRS OXYGEN";
        case LandingRating::Fatal:
            return "SORRY,BUT THERE WERE NO SURVIVORS-YOU BLEW IT!";
    }
    return "";
}

double craterDepthFeet(double impactSpeedMph)
{
    return impactSpeedMph * 0.277777;
}

std::string describeLanding(double impactSpeedMph)
{
    const LandingRating rating = rateLanding(impactSpeedMph);
    if (rating != LandingRating::Fatal) {
        return toString(rating);
    }
    return fmt::format(
        "{}\nIN FACT YOU BLASTED A NEW LUNAR CRATER {:8.2f} FT. DEEP",
        toString(rating),
        craterDepthFeet(impactSpeedMph));
}

const char* toString(TerminalBranch branch)
{
    switch (branch) {
        case TerminalBranch::BallisticFuelOut:
            return "BallisticFuelOut";
        case TerminalBranch::FinalApproach:
            return "FinalApproach";
        case TerminalBranch::FreeFall:
            return "FreeFall";
    }
    return "";
}

int64_t computeFitnessScore(
    double impactSpeedMph,
    double fuelRemainingLbs,
    double fullTankFuelLbs,
    const ScoringConfig& config)
{
    double impact = impactSpeedMph;
    if (impact >= 0.0 && impact < config.acceptableImpactMph) {
        impact = config.acceptableImpactMph;
    }

    double score = (config.speedCeilingMph - impact) * config.scoreMultiplier;

    const double fuelFraction = fullTankFuelLbs > 0.0 ? fuelRemainingLbs / fullTankFuelLbs : 0.0;
    const auto bonus = static_cast<int64_t>(fuelFraction * config.fuelBonusPoints);
    score += static_cast<double>(score <= 0.0 ? -bonus : bonus);

    if (!std::isfinite(score)) {
        return std::numeric_limits<int64_t>::min();
    }
    constexpr double kLimit = static_cast<double>(std::numeric_limits<int64_t>::max() / 2);
    if (std::abs(score) > kLimit) {
        return score > 0.0 ? static_cast<int64_t>(kLimit) : -static_cast<int64_t>(kLimit);
    }
    return static_cast<int64_t>(score);
}

} // namespace LanderSim
