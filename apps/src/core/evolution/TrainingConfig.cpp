#include "TrainingConfig.h"

#include <spdlog/fmt/fmt.h>

namespace LanderSim {

namespace {
constexpr double kSuicideBurnMarginMiles = 50.0;
} // namespace

int enabledInputCount(const PolicyConfig& policy)
{
    int count = 0;
    if (policy.altitudeInput) count++;
    if (policy.downwardSpeedInput) count++;
    if (policy.fuelRemainingInput) count++;
    if (policy.elapsedTimeInput) count++;
    return count;
}

bool isSuicideBurn(const PolicyConfig& policy)
{
    return policy.minimumBurnAltitudeMiles < kSuicideBurnMarginMiles;
}

Result<std::monostate, std::string> validateTrainingConfig(const TrainingConfig& config)
{
    using R = Result<std::monostate, std::string>;

    auto lander = validateLanderConstants(config.lander);
    if (lander.isError()) {
        return lander;
    }

    if (enabledInputCount(config.policy) == 0) {
        return R::error("At least one observation channel must be enabled");
    }
    if (config.policy.hiddenNeurons < 0) {
        return R::error(fmt::format(
            "Hidden neuron count must not be negative (got {})", config.policy.hiddenNeurons));
    }
    if (!(config.policy.minimumBurnAltitudeMiles >= kMinimumRecoverableBurnAltitudeMiles)) {
        return R::error(fmt::format(
            "Minimum burn altitude {} miles is below {} miles; no burn can arrest the descent",
            config.policy.minimumBurnAltitudeMiles,
            kMinimumRecoverableBurnAltitudeMiles));
    }

    if (config.evolution.populationSize < 2) {
        return R::error(fmt::format(
            "Population size must be at least 2 (got {})", config.evolution.populationSize));
    }
    if (config.evolution.randomInjectionPercent < 0
        || config.evolution.randomInjectionPercent > 100) {
        return R::error(fmt::format(
            "Random injection percent must be in [0, 100] (got {})",
            config.evolution.randomInjectionPercent));
    }
    if (config.evolution.maxParallelEvaluations < 0) {
        return R::error("maxParallelEvaluations must not be negative");
    }
    if (config.evolution.maxGenerations < 0) {
        return R::error("maxGenerations must not be negative");
    }

    if (!(config.mutation.perturbationProbability >= 0.0
          && config.mutation.perturbationProbability <= 1.0)) {
        return R::error(fmt::format(
            "Perturbation probability must be in [0, 1] (got {})",
            config.mutation.perturbationProbability));
    }
    if (!(config.mutation.perturbationMagnitude >= 0.0)) {
        return R::error("Perturbation magnitude must not be negative");
    }

    return R::okay(std::monostate{});
}

std::string describeTrainingConfig(const TrainingConfig& config)
{
    const auto& policy = config.policy;
    std::string channels;
    auto addChannel = [&channels](bool enabled, const char* name) {
        if (!enabled) return;
        if (!channels.empty()) channels += ",";
        channels += name;
    };
    addChannel(policy.altitudeInput, "altitude");
    addChannel(policy.downwardSpeedInput, "speed");
    addChannel(policy.fuelRemainingInput, "fuel");
    addChannel(policy.elapsedTimeInput, "time");

    return fmt::format(
        "population={} random={}% hidden={} inputs=[{}] minBurnAlt={}mi{} "
        "mutation={}x{} generations={} seed={}",
        config.evolution.populationSize,
        config.evolution.randomInjectionPercent,
        policy.hiddenNeurons,
        channels,
        policy.minimumBurnAltitudeMiles,
        isSuicideBurn(policy) ? " (suicide burn)" : "",
        config.mutation.perturbationProbability,
        config.mutation.perturbationMagnitude,
        config.evolution.maxGenerations == 0 ? std::string("unlimited")
                                             : std::to_string(config.evolution.maxGenerations),
        config.evolution.rngSeed);
}

} // namespace LanderSim
