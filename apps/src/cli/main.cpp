#include "core/ConfigLoader.h"
#include "core/LoggingChannels.h"
#include "core/evolution/EvolutionTrainer.h"
#include "core/evolution/ReportingSink.h"
#include "core/evolution/TrainingConfig.h"
#include "core/lander/DescentSimulator.h"
#include "core/lander/LandingOutcome.h"
#include "core/lander/ManualBurnController.h"
#include "core/lander/ReferenceFormulaController.h"
#include <args.hxx>
#include <cmath>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <spdlog/fmt/fmt.h>
#include <string>
#include <utility>
#include <vector>

using namespace LanderSim;

namespace {

constexpr double kFeetPerMile = 5280.0;

// Prints the radar table row before every burn decision, then defers to the wrapped
// controller.
class RadarReadoutController : public BurnController {
public:
    RadarReadoutController(BurnController& inner, const LanderConstants& constants, bool echo)
        : inner_(inner), constants_(constants), echo_(echo)
    {}

    double decideBurnRate(const LanderState& state) override
    {
        const double wholeMiles = std::trunc(state.altitudeMiles);
        std::cout << fmt::format(
            "{:7.0f}{:16.0f}{:7.0f}{:15.2f}{:12.1f}     ",
            state.elapsedTimeSec,
            wholeMiles,
            kFeetPerMile * (state.altitudeMiles - wholeMiles),
            constants_.milesPerSecToMph * state.downwardSpeedMilesPerSec,
            state.fuelRemainingLbs(constants_));

        const double rate = inner_.decideBurnRate(state);
        if (echo_) {
            std::cout << "K=:" << rate << "\n";
        }
        return rate;
    }

private:
    BurnController& inner_;
    LanderConstants constants_;
    bool echo_ = false;
};

// Log every improvement and, when requested, also append it to the JSON lines file.
class TeeReportingSink : public ReportingSink {
public:
    TeeReportingSink(ReportingSink& first, ReportingSink* second) : first_(first), second_(second)
    {}

    void onImprovement(const GenerationSummary& summary) override
    {
        first_.onImprovement(summary);
        if (second_) {
            second_->onImprovement(summary);
        }
    }

private:
    ReportingSink& first_;
    ReportingSink* second_ = nullptr;
};

void printTableHeader()
{
    std::cout << "TIME,SECS   ALTITUDE,MILES+FEET   VELOCITY,MPH   FUEL,LBS   FUEL RATE\n";
}

void printOutcome(const DescentOutcome& outcome)
{
    if (outcome.fuelOutTimeSec.has_value()) {
        std::cout << fmt::format("FUEL OUT AT {:8.2f} SECS\n", *outcome.fuelOutTimeSec);
    }
    std::cout << fmt::format("ON THE MOON AT {:8.2f} SECS\n", outcome.elapsedTimeSec);
    std::cout << fmt::format("IMPACT VELOCITY OF {:8.2f} M.P.H.\n", outcome.impactSpeedMph);
    std::cout << fmt::format("FUEL LEFT: {:8.2f} LBS\n", outcome.fuelRemainingLbs);
    std::cout << describeLanding(outcome.impactSpeedMph) << "\n";
}

int runReplayReference(const TrainingConfig& config)
{
    auto created =
        ReferenceFormulaController::create(config.lander, config.policy.minimumBurnAltitudeMiles);
    if (created.isError()) {
        SLOG_ERROR("{}", created.errorValue());
        return 1;
    }

    ReferenceFormulaController controller = std::move(created).value();
    RadarReadoutController readout(controller, config.lander, true);

    DescentSimulator simulator(config.lander);
    printTableHeader();
    const DescentOutcome& outcome = simulator.run(readout);
    std::cout << "\n";
    printOutcome(outcome);
    return 0;
}

int runManualPlay(const TrainingConfig& config)
{
    std::cout << "CONTROL CALLING LUNAR MODULE. MANUAL CONTROL IS NECESSARY\n"
              << fmt::format(
                     "YOU MAY RESET FUEL RATE K EACH {:.0f} SECS TO 0 OR ANY VALUE\n",
                     config.lander.turnLengthSec)
              << fmt::format(
                     "BETWEEN {:.0f} & {:.0f} LBS/SEC. YOU'VE {:.0f} LBS FUEL.\n\n",
                     config.lander.minBurnRateLbsPerSec,
                     config.lander.maxBurnRateLbsPerSec,
                     config.lander.fullTankFuelLbs)
              << "COMMENCE LANDING PROCEDURE\n";

    ManualBurnController manual(std::cin, std::cout, config.lander);
    RadarReadoutController readout(manual, config.lander, false);

    DescentSimulator simulator(config.lander);
    printTableHeader();
    const DescentOutcome& outcome = simulator.run(readout);
    std::cout << "\n";
    printOutcome(outcome);
    return 0;
}

int runTraining(const TrainingConfig& config, const std::string& jsonOut)
{
    LOG_INFO(Training, "Using AI to determine burn rates");
    LOG_INFO(Training, "{}", describeTrainingConfig(config));
    if (isSuicideBurn(config.policy)) {
        LOG_WARN(
            Training,
            "Altitude is set to SUICIDE BURN (extremely low before attempting to slow down)");
    }

    LogReportingSink logSink;
    std::unique_ptr<JsonLinesReportingSink> jsonSink;
    if (!jsonOut.empty()) {
        jsonSink = std::make_unique<JsonLinesReportingSink>(jsonOut);
        if (!jsonSink->isOpen()) {
            return 1;
        }
    }
    TeeReportingSink sink(logSink, jsonSink.get());

    EvolutionTrainer trainer(config, &sink);

    // Must be a plain function pointer; the handler only touches an atomic flag.
    static EvolutionTrainer* g_trainer = nullptr;
    static auto stopHandler = +[](int) -> void {
        if (g_trainer) {
            g_trainer->requestStop();
        }
    };

    g_trainer = &trainer;
    auto oldInt = std::signal(SIGINT, stopHandler);
    auto oldTerm = std::signal(SIGTERM, stopHandler);

    LOG_INFO(Training, "Running Simulation... ctrl-c to end");
    const int generations = trainer.run();

    std::signal(SIGINT, oldInt);
    std::signal(SIGTERM, oldTerm);
    g_trainer = nullptr;

    if (trainer.isStopRequested()) {
        LOG_INFO(Training, "** User requested termination of simulation **");
    }

    const auto& best = trainer.getBestSummary();
    if (best.has_value()) {
        LOG_INFO(
            Training,
            "Finished after {} generation(s); best score {} ({})",
            generations,
            best->bestScore,
            toString(best->bestRating));
        if (jsonSink) {
            std::cout << best->toJson().dump(2) << std::endl;
        }
    }
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    args::ArgumentParser parser(
        "Lunar lander trainer",
        "Evolves a neural-network burn controller for Storer's 1969 lunar lander.\n\n"
        "Commands:\n"
        "  train             Evolve a policy (default)\n"
        "  replay-reference  Fly the built-in formula found by a 48 mile training run\n"
        "  play              Enter burn rates by hand, one per turn");

    args::HelpFlag help(parser, "help", "Display this help menu", { 'h', "help" });
    args::ValueFlag<std::string> configPath(
        parser, "path", "Training config JSON (default: search for training.json)", { "config" });
    args::ValueFlag<std::string> logConfig(
        parser, "path", "Logging config JSON", { "log-config" });
    args::ValueFlag<std::string> channels(
        parser,
        "spec",
        "Channel log levels, e.g. '*:warn,training:info' or 'physics:trace'",
        { 'C', "channels" });
    args::ValueFlag<int> population(
        parser, "count", "Population size (default: 5000)", { "population" });
    args::ValueFlag<int> generations(
        parser,
        "count",
        "Stop after this many generations (default: until Ctrl+C)",
        { "generations" });
    args::ValueFlag<int> hidden(
        parser, "count", "Hidden neurons; 0 for a single neuron (default: 0)", { "hidden" });
    args::ValueFlag<double> minBurnAltitude(
        parser,
        "miles",
        "Altitude below which the engine may fire (default: 48)",
        { "min-burn-altitude" });
    args::ValueFlag<uint32_t> seed(parser, "seed", "RNG seed; 0 = random", { "seed" });
    args::ValueFlag<int> threads(
        parser, "count", "Evaluation threads; 0 = one per core", { "threads" });
    args::ValueFlag<std::string> jsonOut(
        parser, "path", "Append each improvement as a JSON line to this file", { "json-out" });
    args::Positional<std::string> command(parser, "command", "train, replay-reference or play");

    try {
        parser.ParseCLI(argc, argv);
    }
    catch (const args::Help&) {
        std::cout << parser;
        return 0;
    }
    catch (const args::ParseError& e) {
        std::cerr << e.what() << std::endl;
        std::cerr << parser;
        return 1;
    }

    std::optional<std::string> logConfigPath;
    if (logConfig) {
        logConfigPath = args::get(logConfig);
    }
    else if (const auto found = ConfigLoader::findConfigFile("logging-config.json")) {
        logConfigPath = found->string();
    }

    if (!logConfigPath || !LoggingChannels::initializeFromConfig(*logConfigPath, "cli")) {
        LoggingChannels::initialize(spdlog::level::info, spdlog::level::debug, "cli");
    }
    if (channels) {
        LoggingChannels::configureFromString(args::get(channels));
    }

    TrainingConfig config;
    if (configPath) {
        auto loaded = ConfigLoader::loadFromPath<TrainingConfig>(args::get(configPath));
        if (loaded.isError()) {
            SLOG_ERROR("{}", loaded.errorValue());
            return 1;
        }
        config = loaded.value();
    }
    else if (ConfigLoader::findConfigFile("training.json").has_value()) {
        auto loaded = ConfigLoader::load<TrainingConfig>("training.json");
        if (loaded.isError()) {
            SLOG_ERROR("{}", loaded.errorValue());
            return 1;
        }
        config = loaded.value();
    }

    if (population) config.evolution.populationSize = args::get(population);
    if (generations) config.evolution.maxGenerations = args::get(generations);
    if (hidden) config.policy.hiddenNeurons = args::get(hidden);
    if (minBurnAltitude) config.policy.minimumBurnAltitudeMiles = args::get(minBurnAltitude);
    if (seed) config.evolution.rngSeed = args::get(seed);
    if (threads) config.evolution.maxParallelEvaluations = args::get(threads);

    auto valid = validateTrainingConfig(config);
    if (valid.isError()) {
        SLOG_ERROR("Invalid configuration: {}", valid.errorValue());
        return 1;
    }

    const std::string commandName = command ? args::get(command) : "train";
    if (commandName == "train") {
        return runTraining(config, jsonOut ? args::get(jsonOut) : "");
    }
    if (commandName == "replay-reference") {
        return runReplayReference(config);
    }
    if (commandName == "play") {
        return runManualPlay(config);
    }

    std::cerr << "Unknown command: " << commandName << "\n\n" << parser;
    return 1;
}
