#include "Selection.h"

#include "core/Assert.h"

#include <algorithm>
#include <numeric>

namespace LanderSim {

std::vector<int> rankAscending(const std::vector<std::optional<int64_t>>& scores)
{
    std::vector<int> ranking(scores.size());
    std::iota(ranking.begin(), ranking.end(), 0);

    for (const auto& score : scores) {
        LANDERSIM_ASSERT(score.has_value(), "Ranking requires every member to be evaluated");
    }

    std::stable_sort(ranking.begin(), ranking.end(), [&scores](int a, int b) {
        return *scores[a] < *scores[b];
    });

    return ranking;
}

std::vector<std::pair<int, int>> elitistPairings(const std::vector<int>& ranking)
{
    const int count = static_cast<int>(ranking.size());

    std::vector<std::pair<int, int>> pairs;
    pairs.reserve(count / 2);

    for (int i = 0; i < count / 2; i++) {
        pairs.emplace_back(ranking[count - 1 - i], ranking[i]);
    }

    return pairs;
}

int randomInjectionCount(int populationSize, int randomInjectionPercent)
{
    const int requested = populationSize * randomInjectionPercent / 100;
    return std::clamp(requested, 1, std::max(1, populationSize / 2));
}

} // namespace LanderSim
