#include "ReportingSink.h"

#include "core/LoggingChannels.h"

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

namespace LanderSim {

void LogReportingSink::onImprovement(const GenerationSummary& summary)
{
    LOG_INFO(
        Training,
        "Epoch: {} | Score: {} (higher is better) | Rating: {}",
        summary.generationIndex,
        summary.bestScore,
        describeLanding(summary.bestImpactSpeedMph));
    LOG_INFO(
        Training, "Remaining fuel (LB): {:.2f} (higher is better)", summary.bestFuelRemainingLbs);
    LOG_INFO(
        Training, "Impact velocity (MPH): {:.2f} (lower is better)", summary.bestImpactSpeedMph);
    LOG_INFO(Training, "Burn amounts: {}", fmt::join(summary.bestBurnHistory, ", "));
    if (summary.symbolicFormula.has_value()) {
        LOG_INFO(Training, "{}", *summary.symbolicFormula);
    }
}

JsonLinesReportingSink::JsonLinesReportingSink(const std::string& path)
    : path_(path), out_(path, std::ios::out | std::ios::app)
{
    if (!out_.is_open()) {
        LOG_ERROR(Training, "Failed to open report file: {}", path_);
    }
}

void JsonLinesReportingSink::onImprovement(const GenerationSummary& summary)
{
    if (!out_.is_open()) {
        return;
    }
    out_ << summary.toJson().dump() << '\n';
    out_.flush();
    if (!out_) {
        LOG_ERROR(Training, "Failed to write report to {}", path_);
    }
}

} // namespace LanderSim
