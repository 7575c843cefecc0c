#pragma once

#include "GenerationSummary.h"

#include <fstream>
#include <string>

namespace LanderSim {

/**
 * Receives a summary each time the trainer's best score improves. Called on the
 * coordinating thread between generations.
 */
class ReportingSink {
public:
    virtual ~ReportingSink() = default;

    virtual void onImprovement(const GenerationSummary& summary) = 0;
};

// Writes each improvement to the training log channel.
class LogReportingSink : public ReportingSink {
public:
    void onImprovement(const GenerationSummary& summary) override;
};

// Appends one JSON document per improvement to a file.
class JsonLinesReportingSink : public ReportingSink {
public:
    explicit JsonLinesReportingSink(const std::string& path);

    bool isOpen() const { return out_.is_open(); }

    void onImprovement(const GenerationSummary& summary) override;

private:
    std::string path_;
    std::ofstream out_;
};

} // namespace LanderSim
