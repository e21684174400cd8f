#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>

#include "puzzle_errors.hpp"
#include "search_engine.hpp"
#include "state.hpp"

/**
 * @file solver_api.cpp
 * @brief C-friendly wrapper for the search engine so it can be called from Python via ctypes.
 */

extern "C" {
    // Run one search on a space separated state string; time in milliseconds.
    // Returns 1 if a solution was found, 0 otherwise, -1 on bad arguments
    // (null pointers, unknown names, non-positive max_steps), -2 on an invalid
    // state, -3 on an unsolvable one and -4 on any other failure. out_steps is the number of moves.
    int solver_run_instance(
        const char* state,
        const char* algorithm,
        const char* heuristic,
        int max_steps,
        double* out_time_ms,
        int* out_steps,
        long* out_expanded,
        long* out_generated
    ) {
        if (!state || !algorithm || !heuristic || !out_time_ms || !out_steps || !out_expanded || !out_generated) {
            return -1;
        }
        try {
            PuzzleState start = PuzzleState::from_string(std::string(state));
            SearchConfig config;
            config.algorithm = parse_algorithm(std::string(algorithm));
            config.heuristic = parse_heuristic(std::string(heuristic));
            config.max_steps = max_steps;

            SearchResult result = PuzzleSolve(start, config);

            *out_time_ms = result.elapsed.count();
            *out_steps = result.solution_length();
            *out_expanded = result.nodes_expanded;
            *out_generated = result.nodes_generated;
            return result.solved ? 1 : 0;
        } catch (const UnsolvableStateError& e) {
            std::cerr << "solver_run_instance: " << e.what() << '\n';
            return -3;
        } catch (const InvalidStateError& e) {
            std::cerr << "solver_run_instance: " << e.what() << '\n';
            return -2;
        } catch (const std::invalid_argument& e) {
            std::cerr << "solver_run_instance: " << e.what() << '\n';
            return -1;
        } catch (const std::exception& e) {
            std::cerr << "solver_run_instance: " << e.what() << '\n';
            return -4;
        }
    }
}
