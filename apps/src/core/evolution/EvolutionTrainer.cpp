#include "EvolutionTrainer.h"

#include "Mutation.h"
#include "ReportingSink.h"
#include "Selection.h"
#include "core/Assert.h"
#include "core/LoggingChannels.h"
#include "core/brains/NeuralNetBurnController.h"

#include <algorithm>
#include <spdlog/fmt/ranges.h>
#include <system_error>
#include <thread>
#include <vector>

namespace LanderSim {

namespace {

// Joins every started thread on scope exit, including when a later spawn throws.
struct WorkerThreads {
    std::vector<std::thread> threads;

    ~WorkerThreads()
    {
        for (auto& thread : threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }
    }
};

uint32_t resolveSeed(uint32_t requested)
{
    if (requested != 0) {
        return requested;
    }
    std::random_device device;
    return device();
}

} // namespace

int resolveParallelEvaluations(int requested, int populationSize)
{
    // Zero or negative asks for one evaluation per hardware thread.
    int workers = requested > 0 ? requested : static_cast<int>(std::thread::hardware_concurrency());
    workers = std::max(workers, 1);
    return populationSize > 0 ? std::min(workers, populationSize) : workers;
}

void forEachIndexInParallel(
    int count, int threads, const std::function<void(int)>& task, const ThreadLauncher& launch)
{
    threads = std::min(threads, count);
    if (threads <= 1) {
        for (int i = 0; i < count; i++) {
            task(i);
        }
        return;
    }

    std::atomic<int> nextIndex{ 0 };
    auto worker = [&nextIndex, count, &task]() {
        while (true) {
            const int index = nextIndex.fetch_add(1);
            if (index >= count) {
                return;
            }
            task(index);
        }
    };

    WorkerThreads workers;
    workers.threads.reserve(threads - 1);
    for (int i = 0; i < threads - 1; i++) {
        try {
            workers.threads.push_back(launch ? launch(worker) : std::thread(worker));
        }
        catch (const std::system_error& e) {
            // The caller and the threads already running drain the remaining indices.
            LOG_WARN(
                Training,
                "Started {} of {} evaluation thread(s): {}",
                workers.threads.size(),
                threads - 1,
                e.what());
            break;
        }
    }
    worker();
}

const char* toString(EvolutionTrainer::Phase phase)
{
    switch (phase) {
        case EvolutionTrainer::Phase::Initialize:
            return "Initialize";
        case EvolutionTrainer::Phase::Evaluate:
            return "Evaluate";
        case EvolutionTrainer::Phase::Rank:
            return "Rank";
        case EvolutionTrainer::Phase::Breed:
            return "Breed";
        case EvolutionTrainer::Phase::Reset:
            return "Reset";
        case EvolutionTrainer::Phase::Cancelled:
            return "Cancelled";
    }
    return "";
}

EvolutionTrainer::EvolutionTrainer(const TrainingConfig& config, ReportingSink* sink)
    : config_(config),
      sink_(sink),
      layout_(config.policy, config.lander),
      rng_(resolveSeed(config.evolution.rngSeed))
{
    auto valid = validateTrainingConfig(config_);
    if (valid.isError()) {
        LOG_ERROR(Training, "Invalid training config: {}", valid.errorValue());
    }
    LANDERSIM_ASSERT(valid.isValue(), "EvolutionTrainer constructed with invalid config");

    layerWidths_ =
        PolicyNetwork::layerWidthsFor(layout_.inputCount(), config_.policy.hiddenNeurons);
    workerCount_ = resolveParallelEvaluations(
        config_.evolution.maxParallelEvaluations, config_.evolution.populationSize);

    initializePopulation();
}

void EvolutionTrainer::initializePopulation()
{
    setPhase(Phase::Initialize);

    const int size = config_.evolution.populationSize;
    LOG_INFO(Training, "Manufacturing {} lunar lander(s)...", size);

    LOG_DEBUG(Brain, "Policy layer widths: [{}]", fmt::join(layerWidths_, ", "));

    population_.clear();
    population_.reserve(size);
    for (int i = 0; i < size; i++) {
        population_.emplace_back(i, PolicyNetwork(layerWidths_, rng_), config_.lander);
    }
}

void EvolutionTrainer::setPhase(Phase phase)
{
    if (phase == phase_) {
        return;
    }
    LOG_TRACE(State, "Trainer {} -> {}", toString(phase_), toString(phase));
    phase_ = phase;
}

GenerationStats EvolutionTrainer::runGeneration()
{
    generation_++;

    evaluatePopulation();
    GenerationStats stats = rankPopulation();
    reportIfImproved(stats);
    breedPopulation();
    resetPopulation();

    LOG_DEBUG(
        Training,
        "Generation {}: best {} worst {} avg {:.1f} landed {}/{}",
        stats.generation,
        stats.bestScore,
        stats.worstScore,
        stats.averageScore,
        stats.landedCount,
        population_.size());

    return stats;
}

int EvolutionTrainer::run()
{
    LOG_INFO(Training, "Running simulation with {} worker(s)", workerCount_);

    int count = 0;
    const int maxGenerations = config_.evolution.maxGenerations;
    while (!stopRequested_.load() && (maxGenerations == 0 || count < maxGenerations)) {
        runGeneration();
        count++;
    }

    if (stopRequested_.load()) {
        setPhase(Phase::Cancelled);
        LOG_INFO(Training, "Training cancelled after {} generation(s)", generation_);
    }
    return count;
}

void EvolutionTrainer::evaluatePopulation()
{
    setPhase(Phase::Evaluate);

    forEachIndexInParallel(
        static_cast<int>(population_.size()),
        workerCount_,
        [this](int index) { evaluateMember(population_[index]); });
}

void EvolutionTrainer::evaluateMember(PopulationMember& member) const
{
    NeuralNetBurnController controller(member.network, config_.policy, config_.lander);
    const DescentOutcome& outcome = member.simulator.run(controller);

    member.impactSpeedMph = outcome.impactSpeedMph;
    member.fuelRemainingLbs = outcome.fuelRemainingLbs;
    member.burnHistory = outcome.burnHistory;
    member.score = computeFitnessScore(
        outcome.impactSpeedMph,
        outcome.fuelRemainingLbs,
        config_.lander.fullTankFuelLbs,
        config_.scoring);
}

GenerationStats EvolutionTrainer::rankPopulation()
{
    setPhase(Phase::Rank);

    std::vector<std::optional<int64_t>> scores;
    scores.reserve(population_.size());
    for (const auto& member : population_) {
        scores.push_back(member.score);
    }
    lastRanking_ = rankAscending(scores);

    GenerationStats stats;
    stats.generation = generation_;
    stats.bestMemberId = lastRanking_.back();
    stats.bestScore = *population_[lastRanking_.back()].score;
    stats.worstScore = *population_[lastRanking_.front()].score;

    double sum = 0.0;
    for (const auto& member : population_) {
        sum += static_cast<double>(*member.score);
        if (rateLanding(member.impactSpeedMph) != LandingRating::Fatal) {
            stats.landedCount++;
        }
    }
    stats.averageScore = sum / static_cast<double>(population_.size());

    return stats;
}

void EvolutionTrainer::reportIfImproved(const GenerationStats& stats)
{
    if (lastReportedScore_.has_value() && stats.bestScore <= *lastReportedScore_) {
        return;
    }
    lastReportedScore_ = stats.bestScore;

    const PopulationMember& best = population_[stats.bestMemberId];

    GenerationSummary summary;
    summary.generationIndex = generation_;
    summary.bestScore = stats.bestScore;
    summary.bestImpactSpeedMph = best.impactSpeedMph;
    summary.bestFuelRemainingLbs = best.fuelRemainingLbs;
    summary.bestBurnHistory = best.burnHistory;
    summary.bestRating = rateLanding(best.impactSpeedMph);
    summary.symbolicFormula =
        "maxBurn * (" + best.network.exportFormula(layout_.inputNames()) + ")";

    bestSummary_ = summary;

    if (sink_) {
        sink_->onImprovement(summary);
    }
}

void EvolutionTrainer::breedPopulation()
{
    setPhase(Phase::Breed);

    MutationStats mutationStats;
    int perturbations = 0;
    for (const auto& [source, target] : elitistPairings(lastRanking_)) {
        LANDERSIM_ASSERT(source != target, "Breeding source and target must differ");
        population_[source].network.copyInto(population_[target].network);
        population_[target].network.mutateInPlace(config_.mutation, rng_, &mutationStats);
        perturbations += mutationStats.perturbations;
    }

    const int randomCount = randomInjectionCount(
        static_cast<int>(population_.size()), config_.evolution.randomInjectionPercent);
    for (int i = 0; i < randomCount; i++) {
        population_[lastRanking_[i]].network.randomize(rng_);
    }

    LOG_DEBUG(
        Brain,
        "Bred generation {}: {} perturbation(s), {} random genome(s)",
        generation_,
        perturbations,
        randomCount);
}

void EvolutionTrainer::resetPopulation()
{
    setPhase(Phase::Reset);

    for (auto& member : population_) {
        member.simulator.reset();
        member.score.reset();
        member.impactSpeedMph = 0.0;
        member.fuelRemainingLbs = 0.0;
        member.burnHistory.clear();
    }
}

} // namespace LanderSim
