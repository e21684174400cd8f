#ifndef __HEURISTICS_HPP___
#define __HEURISTICS_HPP___

#include <functional>
#include <string>
#include <vector>

#include "state.hpp"

/**
 * @file heuristics.hpp
 * @brief Admissible distance estimates for N-puzzle states.
 *
 * All estimates measure the distance to the canonical goal (1..N*N-1, blank
 * last) and satisfy misplaced_tiles <= manhattan_distance <= linear_conflict.
 */

/**
 * @brief Count tiles (blank excluded) that are not on their goal cell.
 */
int misplaced_tiles(const PuzzleState& state);

/**
 * @brief Sum over tiles of |row - goal_row| + |col - goal_col|.
 */
int manhattan_distance(const PuzzleState& state);

/**
 * @brief Manhattan distance plus 2 for every linear conflict.
 *
 * Each row and each column is scored independently. Only tiles whose goal lies
 * in that line but that are not already on their goal cell take part; every
 * pair of them that appears in reversed goal order is one conflict.
 */
int linear_conflict(const PuzzleState& state);

/**
 * @brief Selectable heuristic variants.
 */
enum class HeuristicKind { Misplaced, Manhattan, LinearConflict };

/**
 * @brief A pure scoring function over states.
 */
using Heuristic = std::function<int(const PuzzleState&)>;

/**
 * @brief Scoring function for a heuristic variant.
 */
Heuristic make_heuristic(HeuristicKind kind);

/**
 * @brief Configuration name of a variant ("misplaced", "manhattan", "linear_conflict").
 */
std::string heuristic_name(HeuristicKind kind);

/**
 * @brief Parse a configuration name.
 * @throws std::invalid_argument for unknown names.
 */
HeuristicKind parse_heuristic(const std::string& name);

/**
 * @brief Every variant, weakest first.
 */
const std::vector<HeuristicKind>& all_heuristics();

#endif // __HEURISTICS_HPP___
