#pragma once

#include "Genome.h"

#include <random>
#include <string>
#include <vector>

namespace LanderSim {

struct MutationConfig;
struct MutationStats;

/**
 * Small feedforward network mapping an observation vector to a control intent in [-1, 1].
 *
 * Every layer, including the output, is an affine map followed by tanh. With no hidden
 * layer the network is a single neuron: tanh(w . input + b).
 *
 * Value type: copying a PolicyNetwork copies its weights. Evaluation has no side effects,
 * so networks owned by different population slots can be evaluated concurrently.
 */
class PolicyNetwork {
public:
    PolicyNetwork() = default;
    explicit PolicyNetwork(const Genome& genome);
    PolicyNetwork(std::vector<int> layerWidths, std::mt19937& rng);

    // [inputs, hidden, 1], or [inputs, 1] when hiddenNeurons is 0.
    static std::vector<int> layerWidthsFor(int inputCount, int hiddenNeurons);

    double evaluate(const std::vector<double>& observation) const;

    void mutateInPlace(
        const MutationConfig& config, std::mt19937& rng, MutationStats* stats = nullptr);
    void randomize(std::mt19937& rng);

    // Overwrite other's weights with this network's. Shapes must match.
    void copyInto(PolicyNetwork& other) const;

    /**
     * Symbolic expression equivalent to evaluate(), e.g.
     *   tanh((0.61*input[0])+(0.88*input[1])+0.49)
     * Hidden neurons are expanded inline. When inputNames is non-empty its entries replace
     * the input[i] placeholders.
     */
    std::string exportFormula(const std::vector<std::string>& inputNames = {}) const;

    const Genome& getGenome() const { return genome_; }
    void setGenome(const Genome& genome);

    const std::vector<int>& getLayerWidths() const { return genome_.layerWidths; }
    int inputCount() const;

private:
    Genome genome_;
};

} // namespace LanderSim
