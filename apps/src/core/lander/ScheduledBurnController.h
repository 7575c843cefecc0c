#pragma once

#include "BurnController.h"

#include <cstddef>
#include <vector>

namespace LanderSim {

/**
 * Replays a recorded sequence of burn rates, one per turn. Once the schedule runs out the
 * engine stays off. Used to reproduce the best landing found by training.
 */
class ScheduledBurnController : public BurnController {
public:
    explicit ScheduledBurnController(std::vector<double> schedule);

    double decideBurnRate(const LanderState& state) override;

    void rewind() { nextTurn_ = 0; }

private:
    std::vector<double> schedule_;
    size_t nextTurn_ = 0;
};

} // namespace LanderSim
