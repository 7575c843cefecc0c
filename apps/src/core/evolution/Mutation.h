#pragma once

#include "EvolutionConfig.h"

#include <random>

namespace LanderSim {

struct Genome;

struct MutationStats {
    int perturbations = 0;
};

/**
 * Mutate a genome by adding bounded uniform noise to a random subset of its weights.
 * The parent is untouched; the child is returned by value.
 */
Genome mutate(
    const Genome& parent,
    const MutationConfig& config,
    std::mt19937& rng,
    MutationStats* stats = nullptr);

} // namespace LanderSim
