#include <iostream>
#include <vector>
#include <random>
#include <chrono>
#include <string>

#include "state.hpp"
#include "heuristics.hpp"
#include "search_engine.hpp"
#include "generate_sample_state.hpp"

using namespace std;

int main(int argc, char** argv) {
    int side_size = 4;
    int depth = 30;
    int max_steps = 200000;
    unsigned int seed = (unsigned int)chrono::high_resolution_clock::now().time_since_epoch().count();

    // Simple argument parsing
    for (int i = 1; i < argc; ++i) {
        string a = argv[i];
        if (a == "--side" && i + 1 < argc) { side_size = stoi(argv[++i]); }
        else if (a == "--depth" && i + 1 < argc) { depth = stoi(argv[++i]); }
        else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
        else if (a == "--max-steps" && i + 1 < argc) { max_steps = stoi(argv[++i]); }
        else if (a == "--help") {
            cout << "Usage: benchmark-search [--side 3|4] [--depth D] [--seed S] [--max-steps N]\n";
            return 0;
        }
    }

    if (side_size != 3 && side_size != 4) {
        cerr << "side must be 3 or 4\n";
        return 3;
    }
    if (depth < 0 || max_steps <= 0) {
        cerr << "depth must be non-negative and max-steps positive\n";
        return 3;
    }

    mt19937 rng(seed);
    PuzzleState start_state = random_state_random_walk(side_size, depth, rng);
    cout << "start: " << start_state.to_string() << '\n';

    // CSV header
    cout << "side_size,depth,seed,algorithm,heuristic,time_ms,found,path_length,nodes_expanded,nodes_generated" << '\n';

    for (Algorithm algorithm : all_algorithms()) {
        for (HeuristicKind heuristic : all_heuristics()) {
            SearchResult result;
            try {
                result = PuzzleSolve(start_state, SearchConfig{algorithm, heuristic, max_steps});
            } catch (const std::exception& e) {
                cerr << "Error solving " << algorithm_name(algorithm) << "/" << heuristic_name(heuristic) << ": " << e.what() << '\n';
                return 4;
            }
            cout << side_size << ',' << depth << ',' << seed << ',' << algorithm_name(algorithm) << ','
                 << heuristic_name(heuristic) << ',' << result.elapsed.count() << ',' << (result.solved ? 1 : 0) << ','
                 << result.solution_length() << ',' << result.nodes_expanded << ',' << result.nodes_generated << '\n';
        }
    }

    return 0;
}
