#pragma once

#include "core/LoggingChannels.h"

#include <algorithm>
#include <memory>
#include <spdlog/sinks/ostream_sink.h>
#include <sstream>
#include <string>

namespace LanderSim::Test {

/**
 * Attaches an in-memory sink to one channel logger for the lifetime of the object and
 * raises the channel to the requested level. The previous level and sinks are restored
 * on destruction.
 */
class ChannelLogCapture {
public:
    ChannelLogCapture(LogChannel channel, spdlog::level::level_enum level)
        : logger_(LoggingChannels::get(channel)),
          sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_)),
          previousLevel_(logger_->level())
    {
        sink_->set_level(spdlog::level::trace);
        sink_->set_pattern("%v");
        logger_->sinks().push_back(sink_);
        logger_->set_level(level);
    }

    ~ChannelLogCapture()
    {
        auto& sinks = logger_->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
        logger_->set_level(previousLevel_);
    }

    ChannelLogCapture(const ChannelLogCapture&) = delete;
    ChannelLogCapture& operator=(const ChannelLogCapture&) = delete;

    std::string text()
    {
        logger_->flush();
        return stream_.str();
    }

private:
    std::ostringstream stream_;
    std::shared_ptr<spdlog::logger> logger_;
    std::shared_ptr<spdlog::sinks::ostream_sink_mt> sink_;
    spdlog::level::level_enum previousLevel_;
};

} // namespace LanderSim::Test
