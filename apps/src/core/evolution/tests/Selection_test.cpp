#include "core/evolution/Selection.h"

#include <gtest/gtest.h>

using namespace LanderSim;

TEST(SelectionTest, RankAscendingPutsWorstFirst)
{
    const std::vector<std::optional<int64_t>> scores = { 5, -10, 30, 0 };

    EXPECT_EQ(rankAscending(scores), (std::vector<int>{ 1, 3, 0, 2 }));
}

TEST(SelectionTest, RankAscendingKeepsSlotOrderOnTies)
{
    const std::vector<std::optional<int64_t>> scores = { 7, 7, 1, 7 };

    EXPECT_EQ(rankAscending(scores), (std::vector<int>{ 2, 0, 1, 3 }));
}

TEST(SelectionTest, WorstReceivesBest)
{
    const std::vector<int> ranking = { 4, 2, 0, 1, 3, 5 };

    const auto pairs = elitistPairings(ranking);

    ASSERT_EQ(pairs.size(), 3u);
    EXPECT_EQ(pairs[0], (std::pair<int, int>{ 5, 4 }));
    EXPECT_EQ(pairs[1], (std::pair<int, int>{ 3, 2 }));
    EXPECT_EQ(pairs[2], (std::pair<int, int>{ 1, 0 }));
}

TEST(SelectionTest, OddPopulationLeavesMedianAlone)
{
    const std::vector<int> ranking = { 0, 1, 2, 3, 4 };

    const auto pairs = elitistPairings(ranking);

    ASSERT_EQ(pairs.size(), 2u);
    for (const auto& [source, target] : pairs) {
        EXPECT_NE(source, 2);
        EXPECT_NE(target, 2);
        EXPECT_LT(target, 2);
        EXPECT_GT(source, 2);
    }
}

TEST(SelectionTest, RandomInjectionCount)
{
    EXPECT_EQ(randomInjectionCount(5000, 10), 500);
    EXPECT_EQ(randomInjectionCount(10, 0), 1);
    EXPECT_EQ(randomInjectionCount(5, 10), 1);
    EXPECT_EQ(randomInjectionCount(10, 100), 5);
    EXPECT_EQ(randomInjectionCount(2, 50), 1);
}
