#include "Mutation.h"

#include "core/brains/Genome.h"
#include "core/brains/WeightType.h"

namespace LanderSim {

Genome mutate(
    const Genome& parent, const MutationConfig& config, std::mt19937& rng, MutationStats* stats)
{
    if (stats) {
        stats->perturbations = 0;
    }

    Genome child = parent;

    std::uniform_real_distribution<WeightType> coin(0.0, 1.0);
    std::uniform_real_distribution<WeightType> noise(-1.0, 1.0);

    for (auto& weight : child.weights) {
        if (coin(rng) < config.perturbationProbability) {
            weight += noise(rng) * config.perturbationMagnitude;
            if (stats) {
                stats->perturbations++;
            }
        }
    }

    return child;
}

} // namespace LanderSim
