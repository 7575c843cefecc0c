#include "core/LoggingChannels.h"

#include <gtest/gtest.h>

using namespace LanderSim;

TEST(LoggingChannelsTest, ParsesLevelNames)
{
    EXPECT_EQ(LoggingChannels::parseLevelString("trace"), spdlog::level::trace);
    EXPECT_EQ(LoggingChannels::parseLevelString("warn"), spdlog::level::warn);
    EXPECT_EQ(LoggingChannels::parseLevelString("off"), spdlog::level::off);
}

TEST(LoggingChannelsTest, ChannelSpecSetsIndividualLevels)
{
    LoggingChannels::get(LogChannel::Training);
    LoggingChannels::configureFromString("*:warn,physics:trace");

    EXPECT_EQ(LoggingChannels::get(LogChannel::Physics)->level(), spdlog::level::trace);
    EXPECT_EQ(LoggingChannels::get(LogChannel::Training)->level(), spdlog::level::warn);

    LoggingChannels::configureFromString("physics : info");
    EXPECT_EQ(LoggingChannels::get(LogChannel::Physics)->level(), spdlog::level::info);
}

TEST(LoggingChannelsTest, UnknownChannelIsIgnored)
{
    LoggingChannels::get(LogChannel::Brain);
    LoggingChannels::setChannelLevel(LogChannel::Brain, spdlog::level::debug);
    LoggingChannels::configureFromString("nosuchchannel:trace,missingcolon");

    EXPECT_EQ(LoggingChannels::get(LogChannel::Brain)->level(), spdlog::level::debug);
}
