#pragma once

#include "PolicyConfig.h"
#include "core/lander/LanderConstants.h"
#include "core/lander/LanderState.h"

#include <string>
#include <vector>

namespace LanderSim {

/**
 * Maps lander state onto the network's input vector, in a fixed channel order:
 * altitude / 150, downward speed (miles/sec), fuel / full tank, elapsed time / 200.
 * Disabled channels are skipped.
 */
class ObservationLayout {
public:
    ObservationLayout(const PolicyConfig& config, const LanderConstants& constants);

    int inputCount() const { return static_cast<int>(names_.size()); }

    std::vector<double> buildObservation(const LanderState& state) const;

    // Human-readable expression for each input, used when exporting formulas.
    const std::vector<std::string>& inputNames() const { return names_; }

private:
    PolicyConfig config_;
    LanderConstants constants_;
    std::vector<std::string> names_;
};

} // namespace LanderSim
