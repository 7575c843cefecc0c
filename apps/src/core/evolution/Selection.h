#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace LanderSim {

/**
 * Slot indices ordered by ascending score: front is the worst, back the best. Ties keep
 * slot order. Every score must be present.
 */
std::vector<int> rankAscending(const std::vector<std::optional<int64_t>>& scores);

/**
 * Elitist pairing over a ranking. Returns (source, target) pairs where the i-th worst slot
 * receives the i-th best slot's genome. The top half never appears as a target; with an
 * odd population the median slot is left alone.
 */
std::vector<std::pair<int, int>> elitistPairings(const std::vector<int>& ranking);

/**
 * Number of lowest-ranked slots reseeded with random genomes. Never less than one, never
 * more than the bottom half.
 */
int randomInjectionCount(int populationSize, int randomInjectionPercent);

} // namespace LanderSim
