#include "ObservationLayout.h"

namespace LanderSim {

namespace {
constexpr double kAltitudeScaleMiles = 150.0;
constexpr double kElapsedTimeScaleSec = 200.0;
} // namespace

ObservationLayout::ObservationLayout(const PolicyConfig& config, const LanderConstants& constants)
    : config_(config), constants_(constants)
{
    if (config_.altitudeInput) names_.push_back("(AltitudeInMiles/150)");
    if (config_.downwardSpeedInput) names_.push_back("DownwardSpeedInMilesPerSecond");
    if (config_.fuelRemainingInput) {
        names_.push_back("(FuelRemainingLBs/WeightOfFullTankOfFuelLBs)");
    }
    if (config_.elapsedTimeInput) names_.push_back("(ElapsedTimeInSeconds/200)");
}

std::vector<double> ObservationLayout::buildObservation(const LanderState& state) const
{
    std::vector<double> input;
    input.reserve(names_.size());

    if (config_.altitudeInput) {
        input.push_back(state.altitudeMiles / kAltitudeScaleMiles);
    }
    if (config_.downwardSpeedInput) {
        input.push_back(state.downwardSpeedMilesPerSec);
    }
    if (config_.fuelRemainingInput) {
        input.push_back(state.fuelRemainingLbs(constants_) / constants_.fullTankFuelLbs);
    }
    if (config_.elapsedTimeInput) {
        input.push_back(state.elapsedTimeSec / kElapsedTimeScaleSec);
    }

    return input;
}

} // namespace LanderSim
