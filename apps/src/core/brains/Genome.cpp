#include "Genome.h"

#include <utility>

namespace LanderSim {

namespace {
constexpr WeightType kInitialWeightRange = 0.5;
} // namespace

Genome::Genome(std::vector<int> widths)
    : layerWidths(std::move(widths)), weights(parameterCountFor(layerWidths), 0.0)
{}

size_t Genome::parameterCountFor(const std::vector<int>& widths)
{
    size_t count = 0;
    for (size_t layer = 1; layer < widths.size(); layer++) {
        const auto in = static_cast<size_t>(widths[layer - 1]);
        const auto out = static_cast<size_t>(widths[layer]);
        count += out * in + out;
    }
    return count;
}

Genome Genome::random(const std::vector<int>& widths, std::mt19937& rng)
{
    Genome g(widths);

    std::uniform_real_distribution<WeightType> dist(-kInitialWeightRange, kInitialWeightRange);
    for (auto& w : g.weights) {
        w = dist(rng);
    }

    return g;
}

Genome Genome::constant(const std::vector<int>& widths, WeightType value)
{
    Genome g(widths);
    g.weights.assign(g.weights.size(), value);
    return g;
}

bool Genome::operator==(const Genome& other) const
{
    return layerWidths == other.layerWidths && weights == other.weights;
}

} // namespace LanderSim
