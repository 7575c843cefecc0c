#pragma once

#include "WeightType.h"

#include <cstddef>
#include <random>
#include <vector>

namespace LanderSim {

/**
 * Policy network genome - the layer shape plus a flat vector of weights for evolution.
 *
 * Layout, for each consecutive pair of layer widths (in, out):
 *   out * in weights, row-major by output neuron, followed by out biases.
 */
struct Genome {
    std::vector<int> layerWidths;
    std::vector<WeightType> weights;

    Genome() = default;
    explicit Genome(std::vector<int> widths);

    static Genome random(const std::vector<int>& widths, std::mt19937& rng);
    static Genome constant(const std::vector<int>& widths, WeightType value);

    static size_t parameterCountFor(const std::vector<int>& widths);

    bool operator==(const Genome& other) const;
};

} // namespace LanderSim
