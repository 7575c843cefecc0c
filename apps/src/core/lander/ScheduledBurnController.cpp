#include "ScheduledBurnController.h"

#include <utility>

namespace LanderSim {

ScheduledBurnController::ScheduledBurnController(std::vector<double> schedule)
    : schedule_(std::move(schedule))
{}

double ScheduledBurnController::decideBurnRate(const LanderState& /*state*/)
{
    if (nextTurn_ >= schedule_.size()) {
        return 0.0;
    }
    return schedule_[nextTurn_++];
}

} // namespace LanderSim
