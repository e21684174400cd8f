#include <iostream>
#include <vector>
#include <random>
#include <chrono>
#include <string>
#include <filesystem>

#include "state.hpp"
#include "state_file_operations.hpp"
#include "generate_sample_state.hpp"

using namespace std;

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    int count = 5;
    int side_size = 3;
    unsigned int seed = (unsigned int)chrono::high_resolution_clock::now().time_since_epoch().count();
    string output_file = "data/initial_states_8.txt";

    // Simple argument parsing
    try {
        for (int i = 1; i < argc; ++i) {
            string a = argv[i];
            if (a == "--count" && i + 1 < argc) { count = stoi(argv[++i]); }
            else if (a == "--size" && i + 1 < argc) { side_size = stoi(argv[++i]); }
            else if (a == "--seed" && i + 1 < argc) { seed = (unsigned int)stoul(argv[++i]); }
            else if (a == "--output-file" && i + 1 < argc) { output_file = argv[++i]; }
            else if (a == "--help") {
                cout << "Usage: generate-solvable-states [--count N] [--size 3|4] [--seed S] [--output-file FILE]\n";
                return 0;
            }
            else {
                cerr << "Unknown argument: " << a << '\n';
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        cerr << "Invalid numeric argument: " << e.what() << '\n';
        return 1;
    }

    mt19937 rng(seed);
    try {
        vector<PuzzleState> states = generate_random_solvable(count, side_size, rng);
        fs::path output(output_file);
        if (output.has_parent_path()) {
            fs::create_directories(output.parent_path());
        }
        write_states_to_file(states, output_file);
    } catch (const std::exception& e) {
        cerr << "Error generating states: " << e.what() << '\n';
        return 2;
    }

    cout << "Successfully wrote " << count << " random solvable " << side_size << "x" << side_size
         << " puzzles to " << output_file << " (seed " << seed << ")\n";
    return 0;
}
