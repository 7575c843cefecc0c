#pragma once

#include "EvolutionConfig.h"
#include "core/ReflectSerializer.h"
#include "core/Result.h"
#include "core/brains/PolicyConfig.h"
#include "core/lander/LanderConstants.h"
#include "core/lander/LandingOutcome.h"

#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace LanderSim {

/**
 * Everything a training run needs, loadable as one JSON document. Sections missing from
 * the file keep their defaults.
 */
struct TrainingConfig {
    LanderConstants lander;
    EvolutionConfig evolution;
    MutationConfig mutation;
    PolicyConfig policy;
    ScoringConfig scoring;
};

/**
 * Rejects configurations that could never produce a meaningful run. Called once before
 * any simulation starts.
 */
Result<std::monostate, std::string> validateTrainingConfig(const TrainingConfig& config);

// One-line summary for the start of a training log.
std::string describeTrainingConfig(const TrainingConfig& config);

// True when the policy may wait so long to fire that there is almost no margin for error.
bool isSuicideBurn(const PolicyConfig& policy);

int enabledInputCount(const PolicyConfig& policy);

inline void to_json(nlohmann::json& j, const TrainingConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, TrainingConfig& config)
{
    config = ReflectSerializer::from_json<TrainingConfig>(j);
}

} // namespace LanderSim
