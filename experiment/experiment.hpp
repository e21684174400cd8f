#ifndef __EXPERIMENT_HPP___
#define __EXPERIMENT_HPP___

/**
 * @file experiment.hpp
 * @brief Runs searches over sets of initial states and reports aggregate statistics.
 */

#include <ostream>
#include <random>
#include <string>
#include <vector>

#include "heuristics.hpp"
#include "search_engine.hpp"
#include "state.hpp"

/**
 * @brief One search run together with the configuration that produced it.
 */
struct ExperimentResult {
    Algorithm algorithm;
    HeuristicKind heuristic;
    PuzzleState initial_state;
    SearchResult search;
    // Start state first, goal last; empty when not solved
    std::vector<PuzzleState> solution_path;
};

/**
 * @brief All runs of one algorithm x heuristic combination.
 */
struct ExperimentGroup {
    Algorithm algorithm;
    HeuristicKind heuristic;
    std::vector<ExperimentResult> runs;

    /**
     * @brief Group key such as "astar-manhattan".
     */
    std::string key() const;
};

/**
 * @brief Averages over the runs of a group.
 *
 * average_steps is taken over solved runs only; the other averages over all runs.
 */
struct ExperimentSummary {
    int runs = 0;
    int solved = 0;
    double average_steps = 0.0;
    double average_expanded = 0.0;
    double average_generated = 0.0;
    double average_time_ms = 0.0;
};

/**
 * @brief Run a single search.
 *
 * @throws std::invalid_argument for unknown names or a non-positive step bound.
 * @throws InvalidStateError / UnsolvableStateError for rejected initial states.
 */
ExperimentResult run_experiment(Algorithm algorithm, HeuristicKind heuristic, const PuzzleState& initial_state, int max_steps);

/**
 * @brief Same as above with configuration names and a state string ("1 2 3 ... 0").
 */
ExperimentResult run_experiment(const std::string& algorithm_name, const std::string& heuristic_name,
                                const std::string& initial_state, int max_steps);

/**
 * @brief Run every algorithm x heuristic combination on every state.
 *
 * Runs that throw are reported on stderr and left out of their group.
 */
std::vector<ExperimentGroup> run_all_experiments(const std::vector<PuzzleState>& states, int max_steps);

ExperimentSummary summarize(const ExperimentGroup& group);

/**
 * @brief "(1 2 3 4 5 6 7 b 8)" rendering used in reports.
 */
std::string format_state(const PuzzleState& state);

/**
 * @brief States joined by " -> ".
 */
std::string format_path(const std::vector<PuzzleState>& path);

/**
 * @brief Print the outcome and statistics of a single run.
 */
void print_result(std::ostream& out, const ExperimentResult& result);

/**
 * @brief Print every group with its average solution length and per-run details.
 */
void print_results(std::ostream& out, const std::vector<ExperimentGroup>& groups);

/**
 * @brief Write a Markdown report of the groups.
 *
 * 3x3 results replace the file and start with the main title; 4x4 results are
 * appended as an additional section.
 *
 * @throws std::runtime_error if the file cannot be opened for writing.
 */
void write_markdown_report(const std::string& path, const std::vector<ExperimentGroup>& groups, int side_length);

/**
 * @brief Load the states of a given size, topping the file up to `minimum` entries.
 *
 * Missing states are generated with generate_random_solvable (distinct from the
 * stored ones) and appended to the file, which is created if absent.
 *
 * @throws std::runtime_error if the file cannot be written.
 * @throws InvalidStateError if a stored line is not a valid board.
 */
std::vector<PuzzleState> ensure_initial_states(const std::string& path, int side_length, std::mt19937& rng, int minimum = 5);

#endif // __EXPERIMENT_HPP___
