#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "experiment.hpp"
#include "generate_sample_state.hpp"
#include "puzzle_errors.hpp"
#include "state_file_operations.hpp"

using namespace std;

namespace fs = std::filesystem;

string ExperimentGroup::key() const {
    return algorithm_name(algorithm) + "-" + heuristic_name(heuristic);
}

ExperimentResult run_experiment(Algorithm algorithm, HeuristicKind heuristic, const PuzzleState& initial_state, int max_steps) {
    SearchResult search = PuzzleSolve(initial_state, SearchConfig{algorithm, heuristic, max_steps});
    vector<PuzzleState> solution_path;
    if (search.solved) {
        solution_path = replay_moves(initial_state, search.path);
    }
    return ExperimentResult{algorithm, heuristic, initial_state, search, solution_path};
}

ExperimentResult run_experiment(const string& algorithm_name, const string& heuristic_name,
                                const string& initial_state, int max_steps) {
    PuzzleState start = PuzzleState::from_string(initial_state);
    return run_experiment(parse_algorithm(algorithm_name), parse_heuristic(heuristic_name), start, max_steps);
}

vector<ExperimentGroup> run_all_experiments(const vector<PuzzleState>& states, int max_steps) {
    vector<ExperimentGroup> groups;
    for (Algorithm algorithm : all_algorithms()) {
        for (HeuristicKind heuristic : all_heuristics()) {
            ExperimentGroup group{algorithm, heuristic, {}};
            for (const auto& state : states) {
                try {
                    group.runs.push_back(run_experiment(algorithm, heuristic, state, max_steps));
                } catch (const invalid_argument& e) {
                    cerr << "Error running " << group.key() << " on " << format_state(state) << ": " << e.what() << '\n';
                }
            }
            groups.push_back(std::move(group));
        }
    }
    return groups;
}

ExperimentSummary summarize(const ExperimentGroup& group) {
    ExperimentSummary summary;
    summary.runs = static_cast<int>(group.runs.size());
    if (group.runs.empty()) return summary;
    double steps = 0.0;
    for (const auto& run : group.runs) {
        if (run.search.solved) {
            ++summary.solved;
            steps += run.search.solution_length();
        }
        summary.average_expanded += run.search.nodes_expanded;
        summary.average_generated += run.search.nodes_generated;
        summary.average_time_ms += run.search.elapsed.count();
    }
    if (summary.solved > 0) summary.average_steps = steps / summary.solved;
    summary.average_expanded /= summary.runs;
    summary.average_generated /= summary.runs;
    summary.average_time_ms /= summary.runs;
    return summary;
}

string format_state(const PuzzleState& state) {
    ostringstream out;
    out << '(';
    const auto& tiles = state.get_tiles();
    for (size_t i = 0; i < tiles.size(); ++i) {
        if (i) out << ' ';
        if (tiles[i] == 0) {
            out << 'b';
        } else {
            out << tiles[i];
        }
    }
    out << ')';
    return out.str();
}

string format_path(const vector<PuzzleState>& path) {
    string text;
    for (size_t i = 0; i < path.size(); ++i) {
        if (i) text += " -> ";
        text += format_state(path[i]);
    }
    return text;
}

void print_result(ostream& out, const ExperimentResult& result) {
    out << "Initial state: " << format_state(result.initial_state) << '\n';
    if (result.search.solved) {
        out << "Solution found in " << result.search.solution_length() << " steps\n";
        out << "Solution path: " << format_path(result.solution_path) << '\n';
    } else {
        out << "No solution found (" << outcome_name(result.search.outcome) << ").\n";
    }
    out << "Nodes expanded: " << result.search.nodes_expanded << '\n';
    out << "Nodes generated: " << result.search.nodes_generated << '\n';
    out << "Time taken: " << fixed << setprecision(3) << result.search.elapsed.count() << " ms\n";
}

void print_results(ostream& out, const vector<ExperimentGroup>& groups) {
    for (const auto& group : groups) {
        ExperimentSummary summary = summarize(group);
        out << '\n' << algorithm_name(group.algorithm) << " search, heuristic: " << heuristic_name(group.heuristic) << '\n';
        if (summary.solved > 0) {
            out << "Average number of steps: " << fixed << setprecision(2) << summary.average_steps << '\n';
        } else {
            out << "No successful solutions found.\n";
        }
        out << "Average nodes expanded: " << fixed << setprecision(2) << summary.average_expanded
            << ", generated: " << summary.average_generated
            << ", time: " << setprecision(3) << summary.average_time_ms << " ms\n\n";
        for (const auto& run : group.runs) {
            print_result(out, run);
            out << '\n';
        }
    }
}

void write_markdown_report(const string& path, const vector<ExperimentGroup>& groups, int side_length) {
    fs::path report(path);
    if (report.has_parent_path()) {
        fs::create_directories(report.parent_path());
    }
    ofstream f(path, side_length == 3 ? ios::trunc : ios::app);
    if (!f.is_open()) {
        throw runtime_error("Could not open file for writing: " + path);
    }

    if (side_length == 3) {
        f << "# 8-Puzzle Solver Experiment Results\n\n";
    } else {
        f << "\n\n# 15-Puzzle (4x4) Results\n\n";
    }

    f << "## Heuristics Used\n\n";
    f << "### Misplaced Tiles\n";
    f << "Counts the tiles that are not in their goal position.\n\n";
    f << "### Manhattan Distance\n";
    f << "Sums |row - goal_row| + |col - goal_col| over all tiles.\n\n";
    f << "### Linear Conflict\n";
    f << "Manhattan distance plus two moves for every pair of tiles that share their goal row or column but appear in reversed order.\n\n";

    Algorithm current = Algorithm::BestFirst;
    bool first = true;
    for (const auto& group : groups) {
        if (first || group.algorithm != current) {
            f << "## " << algorithm_name(group.algorithm) << " search\n\n";
            current = group.algorithm;
            first = false;
        }
        ExperimentSummary summary = summarize(group);
        f << "### Heuristic: " << heuristic_name(group.heuristic) << "\n\n";
        if (summary.solved > 0) {
            f << "Average number of steps: " << fixed << setprecision(2) << summary.average_steps << "\n\n";
        } else {
            f << "No successful solutions found.\n\n";
        }
        f << "| Initial state | Steps | Nodes expanded | Nodes generated | Time (ms) |\n";
        f << "|---|---|---|---|---|\n";
        for (const auto& run : group.runs) {
            f << "| " << format_state(run.initial_state) << " | ";
            if (run.search.solved) {
                f << run.search.solution_length();
            } else {
                f << outcome_name(run.search.outcome);
            }
            f << " | " << run.search.nodes_expanded << " | " << run.search.nodes_generated
              << " | " << fixed << setprecision(3) << run.search.elapsed.count() << " |\n";
        }
        f << '\n';
        for (const auto& run : group.runs) {
            if (!run.search.solved) continue;
            f << "Solution path for " << format_state(run.initial_state) << ":\n```\n"
              << format_path(run.solution_path) << "\n```\n\n";
        }
    }
}

vector<PuzzleState> ensure_initial_states(const string& path, int side_length, mt19937& rng, int minimum) {
    vector<PuzzleState> states;
    if (fs::exists(path)) {
        states = read_states_from_file(path, side_length);
    }
    if (static_cast<int>(states.size()) >= minimum) {
        return states;
    }

    int needed = minimum - static_cast<int>(states.size());
    cout << "Found only " << states.size() << " " << side_length << "x" << side_length
         << " initial states, generating " << needed << " more random solvable puzzles...\n";
    vector<PuzzleState> generated = generate_random_solvable(needed, side_length, rng, states);

    fs::path file(path);
    if (file.has_parent_path()) {
        fs::create_directories(file.parent_path());
    }
    write_states_to_file(generated, path, fs::exists(path));
    cout << "Added " << needed << " new random solvable " << side_length << "x" << side_length
         << " puzzles to " << path << '\n';

    states.insert(states.end(), generated.begin(), generated.end());
    return states;
}
