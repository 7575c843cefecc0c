#pragma once

namespace LanderSim {

// Double precision keeps exported formulas bit-compatible with evaluate().
using WeightType = double;

} // namespace LanderSim
