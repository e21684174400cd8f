#ifndef __SEARCH_ENGINE_HPP___
#define __SEARCH_ENGINE_HPP___

/**
 * @file search_engine.hpp
 * @brief Best-First and A* graph search over N-puzzle states.
 *
 * Both algorithms run the same loop; they differ only in the ordering key of
 * the frontier (see OrderingPolicy in search_node.hpp).
 */

#include <chrono>
#include <string>
#include <vector>

#include "heuristics.hpp"
#include "search_node.hpp"
#include "state.hpp"

/**
 * @brief Search algorithms selectable from the command line.
 */
enum class Algorithm { BestFirst, AStar };

/**
 * @brief Configuration name of an algorithm ("best-first", "astar").
 */
std::string algorithm_name(Algorithm algorithm);

/**
 * @brief Parse a configuration name.
 * @throws std::invalid_argument for unknown names.
 */
Algorithm parse_algorithm(const std::string& name);

/**
 * @brief Every algorithm in reporting order.
 */
const std::vector<Algorithm>& all_algorithms();

/**
 * @brief Frontier ordering used by an algorithm.
 */
OrderingPolicy ordering_policy(Algorithm algorithm);

/**
 * @brief Terminal state of a finished search.
 *
 * Exhausted and StepLimitReached are outcomes, not errors.
 */
enum class SearchOutcome { Solved, Exhausted, StepLimitReached };

const char* outcome_name(SearchOutcome outcome);

/**
 * @brief Result record of one search run.
 *
 * Statistics are filled in for every outcome. `path` is empty unless solved.
 */
struct SearchResult {
    bool solved = false;
    SearchOutcome outcome = SearchOutcome::Exhausted;
    std::vector<Move> path;
    long nodes_expanded = 0;
    long nodes_generated = 0;
    std::chrono::duration<double, std::milli> elapsed{0.0};

    /**
     * @brief Number of moves in the solution (0 when not solved).
     */
    int solution_length() const {
        return static_cast<int>(path.size());
    }
};

/**
 * @brief Typed search configuration.
 */
struct SearchConfig {
    Algorithm algorithm = Algorithm::AStar;
    HeuristicKind heuristic = HeuristicKind::Manhattan;
    int max_steps = 10000;
};

/**
 * @brief Graph search driver parameterized by the frontier ordering policy.
 *
 * Each call to solve() owns its own frontier, node arena and visited set, so
 * an engine can be reused for independent runs.
 */
class SearchEngine {
public:
    /**
     * @param policy Frontier ordering key.
     * @param max_steps Maximum number of node expansions.
     * @throws std::invalid_argument if max_steps is not positive.
     */
    SearchEngine(OrderingPolicy policy, int max_steps);

    /**
     * @brief Search from `start` to the canonical goal.
     *
     * @param start Initial state.
     * @param heuristic Non-negative estimate of the remaining moves.
     * @return Result record; on success `path` holds the moves of the blank.
     * @throws UnsolvableStateError if the parity test rejects `start`.
     */
    SearchResult solve(const PuzzleState& start, const Heuristic& heuristic) const;

    OrderingPolicy get_policy() const;
    int get_max_steps() const;

private:
    OrderingPolicy policy_;
    int max_steps_;
};

/**
 * @brief Solve with the algorithm, heuristic and step bound of a configuration.
 */
SearchResult PuzzleSolve(const PuzzleState &start, const SearchConfig &config);

/**
 * @brief Solve the puzzle using A* (ordering by g + h).
 */
SearchResult PuzzleSolveAstar(const PuzzleState &start, HeuristicKind heuristic, int max_steps = 10000);

/**
 * @brief Solve the puzzle using greedy Best-First search (ordering by h).
 */
SearchResult PuzzleSolveBestFirst(const PuzzleState &start, HeuristicKind heuristic, int max_steps = 10000);

#endif // __SEARCH_ENGINE_HPP___
