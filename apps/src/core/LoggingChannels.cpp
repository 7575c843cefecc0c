#include "LoggingChannels.h"
#include "Assert.h"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace LanderSim {

namespace {
constexpr const char* kLogFile = "landersim.log";
constexpr const char* kBasePattern = "[%H:%M:%S.%e] [%n] [%^%l%$] [%s:%#] %v";

std::string trim(std::string s)
{
    s.erase(0, s.find_first_not_of(" \t"));
    s.erase(s.find_last_not_of(" \t") + 1);
    return s;
}
} // namespace

bool LoggingChannels::initialized_ = false;
std::vector<spdlog::sink_ptr> LoggingChannels::sharedSinks_;

void LoggingChannels::initialize(
    spdlog::level::level_enum consoleLevel,
    spdlog::level::level_enum fileLevel,
    const std::string& componentName)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return;
    }

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_level(consoleLevel);

    auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, true);
    file_sink->set_level(fileLevel);

    sharedSinks_ = { console_sink, file_sink };

    std::string pattern = componentName == "default"
        ? kBasePattern
        : "[%H:%M:%S.%e] [" + componentName + "] [%n] [%^%l%$] [%s:%#] %v";
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers(sharedSinks_);

    // Separate sinks for the default logger so its pattern doesn't affect channel loggers.
    auto default_console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    default_console_sink->set_level(consoleLevel);
    auto default_file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, false);
    default_file_sink->set_level(fileLevel);

    std::string defaultPattern = componentName == "default"
        ? "[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v"
        : "[%H:%M:%S.%e] [" + componentName + "] [%^%l%$] [%s:%#] %v";
    default_console_sink->set_pattern(defaultPattern);
    default_file_sink->set_pattern(defaultPattern);

    std::string loggerName = componentName.empty() ? "default" : componentName;
    std::vector<spdlog::sink_ptr> defaultSinks = { default_console_sink, default_file_sink };
    auto default_logger =
        std::make_shared<spdlog::logger>(loggerName, defaultSinks.begin(), defaultSinks.end());
    default_logger->set_level(spdlog::level::info);

    spdlog::set_default_logger(default_logger);
    spdlog::flush_every(std::chrono::seconds(1));

    initialized_ = true;
    SLOG_DEBUG("LoggingChannels initialized successfully");
}

std::shared_ptr<spdlog::logger> LoggingChannels::get(LogChannel channel)
{
    // Auto-initialize with defaults if get() is called before initialize().
    // This commonly happens in unit tests that use gtest_main.
    if (!initialized_) {
        initialize(spdlog::level::warn, spdlog::level::debug);
    }

    auto logger = spdlog::get(toString(channel));
    LANDERSIM_ASSERT(logger != nullptr, "LogChannel not found after initialization");
    return logger;
}

void LoggingChannels::configureFromString(const std::string& spec)
{
    if (spec.empty()) return;

    std::stringstream ss(spec);
    std::string item;

    while (std::getline(ss, item, ',')) {
        item = trim(item);

        size_t colonPos = item.find(':');
        if (colonPos == std::string::npos) {
            spdlog::warn("Invalid channel spec (missing colon): {}", item);
            continue;
        }

        const std::string channel = trim(item.substr(0, colonPos));
        const auto level = parseLevelString(trim(item.substr(colonPos + 1)));

        if (channel == "*") {
            spdlog::apply_all(
                [level](std::shared_ptr<spdlog::logger> logger) { logger->set_level(level); });
            spdlog::debug("Set all channels to level: {}", spdlog::level::to_string_view(level));
        }
        else {
            setChannelLevel(channel, level);
        }
    }
}

void LoggingChannels::setChannelLevel(LogChannel channel, spdlog::level::level_enum level)
{
    setChannelLevel(std::string(toString(channel)), level);
}

void LoggingChannels::setChannelLevel(const std::string& channel, spdlog::level::level_enum level)
{
    auto logger = spdlog::get(channel);
    if (!logger) {
        spdlog::warn("Unknown log channel '{}'", channel);
        return;
    }
    logger->set_level(level);
    spdlog::debug("Set channel '{}' to level: {}", channel, spdlog::level::to_string_view(level));
}

void LoggingChannels::createLogger(
    const std::string& name,
    const std::vector<spdlog::sink_ptr>& sinks,
    spdlog::level::level_enum level)
{
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(level);
    spdlog::register_logger(logger);
}

void LoggingChannels::createChannelLoggers(const std::vector<spdlog::sink_ptr>& sinks)
{
    createLogger("brain", sinks, spdlog::level::info);
    createLogger("controls", sinks, spdlog::level::info);
    // Per-substep trace; very chatty with thousands of landers.
    createLogger("physics", sinks, spdlog::level::info);
    createLogger("state", sinks, spdlog::level::debug);
    createLogger("training", sinks, spdlog::level::info);
}

spdlog::level::level_enum LoggingChannels::parseLevelString(const std::string& levelStr)
{
    std::string lower = levelStr;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "trace") {
        return spdlog::level::trace;
    }
    else if (lower == "debug") {
        return spdlog::level::debug;
    }
    else if (lower == "info") {
        return spdlog::level::info;
    }
    else if (lower == "warn" || lower == "warning") {
        return spdlog::level::warn;
    }
    else if (lower == "error" || lower == "err") {
        return spdlog::level::err;
    }
    else if (lower == "critical") {
        return spdlog::level::critical;
    }
    else if (lower == "off") {
        return spdlog::level::off;
    }
    else {
        spdlog::warn("Unknown log level '{}', defaulting to info", levelStr);
        return spdlog::level::info;
    }
}

bool LoggingChannels::initializeFromConfig(
    const std::string& configPath, const std::string& componentName)
{
    if (initialized_) {
        spdlog::warn("LoggingChannels already initialized, skipping re-initialization");
        return false;
    }

    auto config = loadConfigFile(configPath);
    applyConfig(config, componentName);

    initialized_ = true;
    return true;
}

nlohmann::json LoggingChannels::defaultConfig()
{
    return {
        { "defaults",
          { { "console_level", "info" },
            { "file_level", "debug" },
            { "pattern", kBasePattern },
            { "flush_interval_ms", 1000 } } },
        { "sinks",
          { { "console", { { "enabled", true }, { "level", "info" } } },
            { "file",
              { { "enabled", true },
                { "level", "debug" },
                { "path", kLogFile },
                { "truncate", true } } } } },
        { "channels",
          { { "brain", "info" },
            { "controls", "info" },
            { "physics", "info" },
            { "state", "debug" },
            { "training", "info" } } }
    };
}

bool LoggingChannels::createDefaultConfigFile(const std::string& path)
{
    try {
        std::ofstream configFile(path);
        if (!configFile.is_open()) {
            spdlog::error("Failed to create config file: {}", path);
            return false;
        }
        configFile << defaultConfig().dump(2) << std::endl;
        spdlog::info("Created default logging config file: {}", path);
        return true;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to write default config file {}: {}", path, e.what());
        return false;
    }
}

nlohmann::json LoggingChannels::loadConfigFile(const std::string& configPath)
{
    namespace fs = std::filesystem;

    std::string localPath = configPath + ".local";
    std::string pathToUse;

    if (fs::exists(localPath)) {
        pathToUse = localPath;
        spdlog::info("Using local config override: {}", localPath);
    }
    else if (fs::exists(configPath)) {
        pathToUse = configPath;
    }
    else {
        spdlog::info("Config file not found, creating default: {}", configPath);
        if (createDefaultConfigFile(configPath)) {
            pathToUse = configPath;
        }
        else {
            spdlog::warn("Could not create config file, using built-in defaults");
            return defaultConfig();
        }
    }

    try {
        std::ifstream configFile(pathToUse);
        if (!configFile.is_open()) {
            spdlog::error("FATAL: Cannot open config file: {}", pathToUse);
            spdlog::error("Check file permissions or delete the file to regenerate defaults.");
            std::exit(1);
        }

        return nlohmann::json::parse(configFile);
    }
    catch (const nlohmann::json::parse_error& e) {
        spdlog::error("FATAL: Failed to parse config file {}: {}", pathToUse, e.what());
        spdlog::error("Fix the JSON syntax or delete the file to regenerate defaults.");
        std::exit(1);
    }
}

void LoggingChannels::applyConfig(const nlohmann::json& config, const std::string& componentName)
{
    auto consoleLevel = spdlog::level::info;
    auto fileLevel = spdlog::level::debug;
    std::string configPattern = kBasePattern;
    int flushIntervalMs = 1000;

    try {
        if (config.contains("defaults")) {
            const auto& defaults = config["defaults"];
            consoleLevel = parseLevelString(defaults.value("console_level", "info"));
            fileLevel = parseLevelString(defaults.value("file_level", "debug"));
            configPattern = defaults.value("pattern", std::string(kBasePattern));
            flushIntervalMs = defaults.value("flush_interval_ms", 1000);
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error reading defaults from config: {}, using built-in defaults", e.what());
    }

    // Inject component name after the timestamp.
    std::string pattern = configPattern;
    if (componentName != "default") {
        size_t pos = configPattern.find("] ");
        if (pos != std::string::npos) {
            pattern = configPattern.substr(0, pos + 2) + "[" + componentName + "] "
                + configPattern.substr(pos + 2);
        }
        else {
            pattern = "[" + componentName + "] " + configPattern;
        }
    }

    std::vector<spdlog::sink_ptr> sinks;
    std::string filePath = kLogFile;

    try {
        const auto sinksConfig = config.value("sinks", nlohmann::json::object());

        if (sinksConfig.contains("console")) {
            const auto& consoleCfg = sinksConfig["console"];
            if (consoleCfg.value("enabled", true)) {
                auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                console_sink->set_level(parseLevelString(consoleCfg.value("level", "info")));
                sinks.push_back(console_sink);
            }
        }

        if (sinksConfig.contains("file")) {
            const auto& fileCfg = sinksConfig["file"];
            if (fileCfg.value("enabled", true)) {
                filePath = fileCfg.value("path", std::string(kLogFile));
                const auto level = parseLevelString(fileCfg.value("level", "debug"));

                // Use rotating sink if max_size_mb is specified, otherwise basic sink.
                spdlog::sink_ptr file_sink;
                if (fileCfg.contains("max_size_mb")) {
                    const size_t maxSizeMB = fileCfg.value("max_size_mb", 100);
                    const size_t maxFiles = fileCfg.value("max_files", 3);
                    file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                        filePath, maxSizeMB * 1024 * 1024, maxFiles);
                }
                else {
                    file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
                        filePath, fileCfg.value("truncate", true));
                }
                file_sink->set_level(level);
                sinks.push_back(file_sink);
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::error("Error creating sinks from config: {}, using defaults", e.what());
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(consoleLevel);
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(kLogFile, true);
        file_sink->set_level(fileLevel);
        sinks = { console_sink, file_sink };
    }

    sharedSinks_ = sinks;
    for (auto& sink : sharedSinks_) {
        sink->set_pattern(pattern);
    }

    createChannelLoggers(sharedSinks_);

    try {
        if (config.contains("channels")) {
            for (const auto& [channel, levelStr] : config["channels"].items()) {
                setChannelLevel(channel, parseLevelString(levelStr.get<std::string>()));
            }
        }
    }
    catch (const std::exception& e) {
        spdlog::warn("Error applying channel levels from config: {}", e.what());
    }

    // Default logger gets its own sinks (omits channel name to avoid redundancy).
    std::string defaultPattern = componentName == "default"
        ? "[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v"
        : "[%H:%M:%S.%e] [" + componentName + "] [%^%l%$] [%s:%#] %v";

    std::vector<spdlog::sink_ptr> defaultSinks;
    for (const auto& sharedSink : sharedSinks_) {
        spdlog::sink_ptr sink;
        if (dynamic_cast<spdlog::sinks::stdout_color_sink_mt*>(sharedSink.get())) {
            sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        }
        else {
            sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filePath, false);
        }
        sink->set_level(sharedSink->level());
        sink->set_pattern(defaultPattern);
        defaultSinks.push_back(sink);
    }

    std::string loggerName = componentName.empty() ? "default" : componentName;
    auto default_logger =
        std::make_shared<spdlog::logger>(loggerName, defaultSinks.begin(), defaultSinks.end());
    default_logger->set_level(spdlog::level::info);
    spdlog::set_default_logger(default_logger);

    spdlog::flush_every(std::chrono::milliseconds(flushIntervalMs));

    SLOG_DEBUG("LoggingChannels initialized from config successfully");
}

} // namespace LanderSim
