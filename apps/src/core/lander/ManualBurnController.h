#pragma once

#include "BurnController.h"
#include "core/Result.h"

#include <iosfwd>
#include <string>

namespace LanderSim {

/**
 * Burn rate typed by a person, one line per turn.
 *
 * Invalid entries print "NOT POSSIBLE..." and re-prompt; state is untouched until a legal
 * value arrives. If the input stream ends the engine is shut off for the rest of the
 * descent.
 */
class ManualBurnController : public BurnController {
public:
    ManualBurnController(std::istream& input, std::ostream& output, LanderConstants constants);

    double decideBurnRate(const LanderState& state) override;

    Result<double, std::string> readBurnRate();

    int getRejectedCount() const { return rejectedCount_; }
    bool isInputClosed() const { return inputClosed_; }

private:
    std::istream& input_;
    std::ostream& output_;
    LanderConstants constants_;
    int rejectedCount_ = 0;
    bool inputClosed_ = false;
};

} // namespace LanderSim
