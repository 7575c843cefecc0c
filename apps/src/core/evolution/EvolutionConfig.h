#pragma once

#include "core/ReflectSerializer.h"
#include <cstdint>
#include <nlohmann/json.hpp>

namespace LanderSim {

/**
 * Configuration for the genetic algorithm evolution process.
 */
struct EvolutionConfig {
    int populationSize = 5000;
    int randomInjectionPercent = 10; // Lowest-ranked slots reseeded each generation.
    int maxParallelEvaluations = 0;  // 0 = auto (use detected core count).
    int maxGenerations = 0;          // 0 = run until cancelled.
    uint32_t rngSeed = 0;            // 0 = seed from std::random_device.
};

/**
 * Configuration for genome mutation during evolution.
 */
struct MutationConfig {
    double perturbationProbability = 0.25; // Probability each weight is perturbed.
    double perturbationMagnitude = 0.5;    // Perturbation drawn from uniform(-1, 1) * magnitude.
};

inline void to_json(nlohmann::json& j, const EvolutionConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, EvolutionConfig& config)
{
    config = ReflectSerializer::from_json<EvolutionConfig>(j);
}

inline void to_json(nlohmann::json& j, const MutationConfig& config)
{
    j = ReflectSerializer::to_json(config);
}

inline void from_json(const nlohmann::json& j, MutationConfig& config)
{
    config = ReflectSerializer::from_json<MutationConfig>(j);
}

} // namespace LanderSim
