#include "PolicyNetwork.h"

#include "core/Assert.h"
#include "core/evolution/Mutation.h"

#include <cmath>
#include <spdlog/fmt/fmt.h>
#include <utility>

namespace LanderSim {

namespace {

std::string inputName(const std::vector<std::string>& names, size_t index)
{
    if (index < names.size()) {
        return names[index];
    }
    return fmt::format("input[{}]", index);
}

void assertGenomeShape(const Genome& genome)
{
    LANDERSIM_ASSERT(genome.layerWidths.size() >= 2, "Policy network needs at least two layers");
    LANDERSIM_ASSERT(genome.layerWidths.back() == 1, "Policy network must have one output");
    LANDERSIM_ASSERT(
        genome.weights.size() == Genome::parameterCountFor(genome.layerWidths),
        "Genome weight count does not match its layer widths");
}

} // namespace

PolicyNetwork::PolicyNetwork(const Genome& genome) : genome_(genome)
{
    assertGenomeShape(genome_);
}

PolicyNetwork::PolicyNetwork(std::vector<int> layerWidths, std::mt19937& rng)
    : genome_(Genome::random(layerWidths, rng))
{
    assertGenomeShape(genome_);
}

std::vector<int> PolicyNetwork::layerWidthsFor(int inputCount, int hiddenNeurons)
{
    LANDERSIM_ASSERT(inputCount > 0, "Policy network needs at least one input");
    LANDERSIM_ASSERT(hiddenNeurons >= 0, "Hidden neuron count must not be negative");

    if (hiddenNeurons == 0) {
        return { inputCount, 1 };
    }
    return { inputCount, hiddenNeurons, 1 };
}

int PolicyNetwork::inputCount() const
{
    return genome_.layerWidths.empty() ? 0 : genome_.layerWidths.front();
}

double PolicyNetwork::evaluate(const std::vector<double>& observation) const
{
    LANDERSIM_ASSERT(
        static_cast<int>(observation.size()) == inputCount(),
        "Observation size does not match network input width");

    std::vector<double> activations = observation;
    std::vector<double> next;
    size_t idx = 0;

    for (size_t layer = 1; layer < genome_.layerWidths.size(); layer++) {
        const int in = genome_.layerWidths[layer - 1];
        const int out = genome_.layerWidths[layer];
        const size_t biasBase = idx + static_cast<size_t>(out) * static_cast<size_t>(in);

        next.assign(out, 0.0);
        for (int o = 0; o < out; o++) {
            // Same summation order as exportFormula(): weighted inputs first, bias last.
            double sum = 0.0;
            for (int i = 0; i < in; i++) {
                sum += genome_.weights[idx++] * activations[i];
            }
            sum += genome_.weights[biasBase + o];
            next[o] = std::tanh(sum);
        }

        idx = biasBase + out;
        std::swap(activations, next);
    }

    return activations[0];
}

void PolicyNetwork::mutateInPlace(
    const MutationConfig& config, std::mt19937& rng, MutationStats* stats)
{
    genome_ = mutate(genome_, config, rng, stats);
}

void PolicyNetwork::randomize(std::mt19937& rng)
{
    genome_ = Genome::random(genome_.layerWidths, rng);
}

void PolicyNetwork::copyInto(PolicyNetwork& other) const
{
    LANDERSIM_ASSERT(
        other.genome_.layerWidths == genome_.layerWidths,
        "copyInto requires networks of identical shape");
    if (&other == this) {
        return;
    }
    other.genome_.weights = genome_.weights;
}

void PolicyNetwork::setGenome(const Genome& genome)
{
    assertGenomeShape(genome);
    genome_ = genome;
}

std::string PolicyNetwork::exportFormula(const std::vector<std::string>& inputNames) const
{
    std::vector<std::string> terms;
    terms.reserve(inputCount());
    for (int i = 0; i < inputCount(); i++) {
        terms.push_back(inputName(inputNames, static_cast<size_t>(i)));
    }

    size_t idx = 0;
    for (size_t layer = 1; layer < genome_.layerWidths.size(); layer++) {
        const int in = genome_.layerWidths[layer - 1];
        const int out = genome_.layerWidths[layer];
        const size_t biasBase = idx + static_cast<size_t>(out) * static_cast<size_t>(in);

        std::vector<std::string> next;
        next.reserve(out);
        for (int o = 0; o < out; o++) {
            std::string expr = "tanh(";
            for (int i = 0; i < in; i++) {
                expr += fmt::format("({}*{})+", genome_.weights[idx++], terms[i]);
            }
            expr += fmt::format("{})", genome_.weights[biasBase + o]);
            next.push_back(std::move(expr));
        }

        idx = biasBase + out;
        terms = std::move(next);
    }

    return terms.empty() ? std::string() : terms[0];
}

} // namespace LanderSim
