#include <iostream>
#include <vector>
#include <random>
#include <chrono>
#include <string>

#include "state.hpp"
#include "experiment.hpp"
#include "puzzle_errors.hpp"

using namespace std;

/**
 * @file main.cpp
 * @brief Command-line front end: solve one state or run every algorithm x heuristic combination.
 */

static void print_usage() {
    cout << "Usage: puzzle-solver [options]\n";
    cout << "Options:\n";
    cout << "  --algorithm A         best-first or astar\n";
    cout << "  --heuristic H         misplaced, manhattan or linear_conflict\n";
    cout << "  --state \"S\"           Initial state (space-separated, 0 for the blank)\n";
    cout << "  --max-steps N         Maximum node expansions (default: 10000)\n";
    cout << "  --all                 Run all combinations on the states file\n";
    cout << "  --size 8|15           Puzzle size (default: 8)\n";
    cout << "  --states-file FILE    Initial states (default: data/initial_states_<size>.txt)\n";
    cout << "  --report FILE         Markdown report for --all (default: reports/results.md)\n";
    cout << "  --seed S              Seed for generating missing initial states\n";
}

int main(int argc, char** argv) {
    string algorithm;
    string heuristic;
    string state;
    int max_steps = 10000;
    bool run_all = false;
    int size = 8;
    string states_file;
    string report_file = "reports/results.md";
    unsigned int seed = (unsigned int)chrono::high_resolution_clock::now().time_since_epoch().count();

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--algorithm" && i + 1 < argc) { algorithm = argv[++i]; }
            else if (a == "--heuristic" && i + 1 < argc) { heuristic = argv[++i]; }
            else if (a == "--state" && i + 1 < argc) { state = argv[++i]; }
            else if (a == "--max-steps" && i + 1 < argc) { max_steps = stoi(argv[++i]); }
            else if (a == "--all") { run_all = true; }
            else if (a == "--size" && i + 1 < argc) { size = stoi(argv[++i]); }
            else if (a == "--states-file" && i + 1 < argc) { states_file = argv[++i]; }
            else if (a == "--report" && i + 1 < argc) { report_file = argv[++i]; }
            else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
            else if (a == "--help") {
                print_usage();
                return 0;
            }
            else {
                cerr << "Unknown argument: " << a << '\n';
                print_usage();
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        cerr << "Invalid numeric argument: " << e.what() << '\n';
        return 1;
    }

    if (size != 8 && size != 15) {
        cerr << "--size must be 8 or 15\n";
        return 1;
    }
    if (max_steps <= 0) {
        cerr << "--max-steps must be positive\n";
        return 1;
    }
    int side_length = size == 8 ? 3 : 4;
    if (states_file.empty()) {
        states_file = "data/initial_states_" + to_string(size) + ".txt";
    }
    mt19937 rng(seed);

    if (!run_all && !algorithm.empty() && !heuristic.empty()) {
        try {
            if (state.empty()) {
                vector<PuzzleState> states = ensure_initial_states(states_file, side_length, rng);
                state = states.front().to_string();
            }
            cout << "Running " << algorithm << " search with " << heuristic << " heuristic on state: " << state << '\n';
            ExperimentResult result = run_experiment(algorithm, heuristic, state, max_steps);
            cout << '\n';
            print_result(cout, result);
        } catch (const UnsolvableStateError& e) {
            cerr << "Unsolvable initial state: " << e.what() << '\n';
            return 3;
        } catch (const InvalidStateError& e) {
            cerr << "Invalid initial state: " << e.what() << '\n';
            return 2;
        } catch (const std::exception& e) {
            cerr << "Error: " << e.what() << '\n';
            return 1;
        }
        return 0;
    }

    if (!run_all && (!algorithm.empty() || !heuristic.empty())) {
        cerr << "--algorithm and --heuristic must be given together\n";
        return 1;
    }

    // Default: run all experiments
    try {
        vector<PuzzleState> states = ensure_initial_states(states_file, side_length, rng);
        cout << "Running all experiments on " << states.size() << " initial states ("
             << side_length << "x" << side_length << " grid)...\n";
        vector<ExperimentGroup> groups = run_all_experiments(states, max_steps);
        print_results(cout, groups);
        write_markdown_report(report_file, groups, side_length);
        cout << "\nDetailed report saved to " << report_file << '\n';
    } catch (const std::exception& e) {
        cerr << "Error: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
