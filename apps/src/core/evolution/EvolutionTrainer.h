#pragma once

#include "GenerationSummary.h"
#include "PopulationMember.h"
#include "TrainingConfig.h"
#include "core/brains/ObservationLayout.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <thread>
#include <vector>

namespace LanderSim {

class ReportingSink;

/**
 * Picks the evaluation worker count: the detected core count when requested is 0,
 * clamped to [1, populationSize].
 */
int resolveParallelEvaluations(int requested, int populationSize);

using ThreadLauncher = std::function<std::thread(std::function<void()>)>;

/**
 * Runs task(i) for every i in [0, count) exactly once, spread over up to `threads`
 * threads including the caller. Indices are handed out through an atomic counter.
 * If starting a thread fails with std::system_error the work continues on the threads
 * already running. `launch` defaults to constructing a std::thread.
 */
void forEachIndexInParallel(
    int count,
    int threads,
    const std::function<void(int)>& task,
    const ThreadLauncher& launch = {});

/**
 * Generational trainer for lander policies.
 *
 *   Initialize -> { Evaluate -> Rank -> Breed -> Reset }* -> Cancelled
 *
 * Evaluate fans out over worker threads; each member's network and simulator are touched
 * by exactly one worker. Rank, Breed and Reset run on the calling thread. Breeding keeps
 * the better half, overwrites each slot of the worse half with a mutated copy of its
 * mirror in the better half, and reseeds the lowest slots with random genomes.
 *
 * requestStop() may be called from any thread or a signal handler. It is honoured between
 * generations; a generation in flight always completes.
 */
class EvolutionTrainer {
public:
    enum class Phase : uint8_t {
        Initialize,
        Evaluate,
        Rank,
        Breed,
        Reset,
        Cancelled,
    };

    // The config must pass validateTrainingConfig().
    explicit EvolutionTrainer(const TrainingConfig& config, ReportingSink* sink = nullptr);

    // One full generation. Returns the stats of the generation just evaluated.
    GenerationStats runGeneration();

    // Runs generations until stopped or maxGenerations is reached. Returns the count run.
    int run();

    void requestStop() { stopRequested_.store(true); }
    bool isStopRequested() const { return stopRequested_.load(); }

    Phase getPhase() const { return phase_; }
    int getGenerationCount() const { return generation_; }
    int getWorkerCount() const { return workerCount_; }

    const std::vector<PopulationMember>& getPopulation() const { return population_; }

    // Slot ids of the last ranking, worst first.
    const std::vector<int>& getLastRanking() const { return lastRanking_; }

    const std::optional<GenerationSummary>& getBestSummary() const { return bestSummary_; }

private:
    void setPhase(Phase phase);
    void initializePopulation();
    void evaluatePopulation();
    void evaluateMember(PopulationMember& member) const;
    GenerationStats rankPopulation();
    void reportIfImproved(const GenerationStats& stats);
    void breedPopulation();
    void resetPopulation();

    TrainingConfig config_;
    ReportingSink* sink_ = nullptr;
    ObservationLayout layout_;
    std::vector<int> layerWidths_;
    int workerCount_ = 1;

    std::mt19937 rng_;
    std::vector<PopulationMember> population_;
    std::vector<int> lastRanking_;

    Phase phase_ = Phase::Initialize;
    int generation_ = 0;
    std::optional<int64_t> lastReportedScore_;
    std::optional<GenerationSummary> bestSummary_;

    std::atomic<bool> stopRequested_{ false };
};

const char* toString(EvolutionTrainer::Phase phase);

} // namespace LanderSim
