#include "ManualBurnController.h"
#include "BurnRate.h"
#include "core/LoggingChannels.h"

#include <charconv>
#include <istream>
#include <ostream>

namespace LanderSim {

namespace {

bool parseDouble(const std::string& text, double& value)
{
    const auto first = text.find_first_not_of(" \t\r");
    if (first == std::string::npos) {
        return false;
    }
    const auto last = text.find_last_not_of(" \t\r");
    const char* begin = text.data() + first;
    const char* end = text.data() + last + 1;
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    return ec == std::errc() && ptr == end;
}

} // namespace

ManualBurnController::ManualBurnController(
    std::istream& input, std::ostream& output, LanderConstants constants)
    : input_(input), output_(output), constants_(constants)
{}

Result<double, std::string> ManualBurnController::readBurnRate()
{
    std::string line;
    while (true) {
        output_ << "K=:";
        output_.flush();

        if (!std::getline(input_, line)) {
            return Result<double, std::string>::error("burn rate input closed");
        }

        double value = 0.0;
        if (parseDouble(line, value) && isValidManualBurnRate(value, constants_)) {
            return Result<double, std::string>::okay(value);
        }

        rejectedCount_++;
        LOG_DEBUG(Controls, "Rejected manual burn rate '{}'", line);
        output_ << "NOT POSSIBLE" << std::string(51, '.');
    }
}

double ManualBurnController::decideBurnRate(const LanderState& /*state*/)
{
    if (inputClosed_) {
        return 0.0;
    }

    auto result = readBurnRate();
    if (result.isError()) {
        LOG_WARN(Controls, "{}, shutting engine off", result.errorValue());
        inputClosed_ = true;
        return 0.0;
    }
    return result.value();
}

} // namespace LanderSim
