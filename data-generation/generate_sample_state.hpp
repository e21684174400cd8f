#ifndef __GENERATE_SAMPLE_STATE_HPP___
#define __GENERATE_SAMPLE_STATE_HPP___

#include "state.hpp"
#include <algorithm>
#include <random>
#include <set>
#include <stdexcept>
#include <vector>

/**
 * @file generate_sample_state.hpp
 * @brief Utilities to create random puzzle states for experiments, benchmarks and testing.
 *
 * Two sampling strategies are provided:
 * - random walk: perform `target_depth` random legal moves from the goal state
 * - shuffling: permute the goal tiles uniformly and keep only solvable layouts
 */

/**
 * @brief Generate a random state by performing a random walk from the solved state.
 *
 * The function starts from the canonical solved state and applies
 * `target_depth` uniformly-random legal moves, never undoing the previous move
 * directly, and returns the final state. The result is always solvable and at
 * most `target_depth` moves from the goal.
 *
 * @param side_size Board side length (3 or 4).
 * @param target_depth Number of random moves to perform.
 * @param rng Random number generator to use (std::mt19937).
 * @return A sampled `PuzzleState`.
 */
inline PuzzleState random_state_random_walk(int side_size, int target_depth, std::mt19937 &rng) {
    PuzzleState temp_state = PuzzleState::goal(side_size);
    PuzzleState previous = temp_state;
    for (int i = 0; i < target_depth; ++i) {
        std::vector<PuzzleState> moves;
        for (const auto& neighbor : temp_state.neighbors()) {
            if (i == 0 || neighbor.second != previous) moves.push_back(neighbor.second);
        }
        std::uniform_int_distribution<size_t> dist(0, moves.size() - 1);
        previous = temp_state;
        temp_state = moves[dist(rng)];
    }
    return temp_state;
}

/**
 * @brief Generate `n` distinct solvable states by shuffling the goal tiles.
 *
 * Shuffles are drawn until `n` different layouts pass the parity test.
 *
 * @param n Number of states to generate.
 * @param side_size Board side length (3 or 4).
 * @param rng Random number generator to use (std::mt19937).
 * @param exclude States that must not be returned (e.g. already stored ones).
 * @throws std::invalid_argument if n <= 0 or the side length is unsupported.
 * @return `n` distinct solvable states in generation order.
 */
inline std::vector<PuzzleState> generate_random_solvable(int n, int side_size, std::mt19937 &rng,
                                                         const std::vector<PuzzleState>& exclude = {}) {
    if (n <= 0) {
        throw std::invalid_argument("Number of puzzles must be positive");
    }
    if (side_size != 3 && side_size != 4) {
        throw std::invalid_argument("Only puzzles of size 3 (8-puzzle) or 4 (15-puzzle) are supported");
    }
    std::vector<int> tiles = PuzzleState::goal(side_size).get_tiles();
    std::set<PuzzleState> unique_states(exclude.begin(), exclude.end());
    std::vector<PuzzleState> result;
    while (static_cast<int>(result.size()) < n) {
        std::shuffle(tiles.begin(), tiles.end(), rng);
        PuzzleState candidate(tiles);
        if (candidate.is_solvable() && unique_states.insert(candidate).second) {
            result.push_back(candidate);
        }
    }
    return result;
}

#endif // __GENERATE_SAMPLE_STATE_HPP___
