#include <cstdlib>
#include <stdexcept>
#include <vector>

#include "heuristics.hpp"

using namespace std;

namespace {

// Goal cell of tile value t is t - 1.
int goal_row(int tile, int side_length) {
    return (tile - 1) / side_length;
}

int goal_column(int tile, int side_length) {
    return (tile - 1) % side_length;
}

// Pairs appearing in reverse goal order among the tiles of one line.
int reversed_pairs(const vector<int>& goal_offsets) {
    int pairs = 0;
    for (size_t i = 0; i < goal_offsets.size(); ++i) {
        for (size_t j = i + 1; j < goal_offsets.size(); ++j) {
            if (goal_offsets[i] > goal_offsets[j]) ++pairs;
        }
    }
    return pairs;
}

}

int misplaced_tiles(const PuzzleState& state) {
    int count = 0;
    int num_cells = state.get_num_cells();
    for (int position = 0; position < num_cells; ++position) {
        int tile = state.get_tile(position);
        if (tile != 0 && tile != position + 1) ++count;
    }
    return count;
}

int manhattan_distance(const PuzzleState& state) {
    int distance = 0;
    int side_length = state.get_side_length();
    int num_cells = state.get_num_cells();
    for (int position = 0; position < num_cells; ++position) {
        int tile = state.get_tile(position);
        if (tile == 0) continue;
        int current_row = position / side_length;
        int current_col = position % side_length;
        distance += abs(current_row - goal_row(tile, side_length)) + abs(current_col - goal_column(tile, side_length));
    }
    return distance;
}

int linear_conflict(const PuzzleState& state) {
    int side_length = state.get_side_length();
    int conflicts = 0;
    vector<int> offsets;
    offsets.reserve(side_length);

    // Check row conflicts
    for (int row = 0; row < side_length; ++row) {
        offsets.clear();
        for (int col = 0; col < side_length; ++col) {
            int position = row * side_length + col;
            int tile = state.get_tile(position);
            if (tile == 0 || tile == position + 1) continue;
            if (goal_row(tile, side_length) != row) continue;
            offsets.push_back(goal_column(tile, side_length));
        }
        conflicts += reversed_pairs(offsets);
    }

    // Check column conflicts
    for (int col = 0; col < side_length; ++col) {
        offsets.clear();
        for (int row = 0; row < side_length; ++row) {
            int position = row * side_length + col;
            int tile = state.get_tile(position);
            if (tile == 0 || tile == position + 1) continue;
            if (goal_column(tile, side_length) != col) continue;
            offsets.push_back(goal_row(tile, side_length));
        }
        conflicts += reversed_pairs(offsets);
    }

    return manhattan_distance(state) + 2 * conflicts;
}

Heuristic make_heuristic(HeuristicKind kind) {
    switch (kind) {
        case HeuristicKind::Misplaced: return misplaced_tiles;
        case HeuristicKind::Manhattan: return manhattan_distance;
        case HeuristicKind::LinearConflict: return linear_conflict;
    }
    throw invalid_argument("Unknown heuristic kind");
}

string heuristic_name(HeuristicKind kind) {
    switch (kind) {
        case HeuristicKind::Misplaced: return "misplaced";
        case HeuristicKind::Manhattan: return "manhattan";
        case HeuristicKind::LinearConflict: return "linear_conflict";
    }
    throw invalid_argument("Unknown heuristic kind");
}

HeuristicKind parse_heuristic(const string& name) {
    for (HeuristicKind kind : all_heuristics()) {
        if (heuristic_name(kind) == name) return kind;
    }
    throw invalid_argument("Unknown heuristic: " + name);
}

const vector<HeuristicKind>& all_heuristics() {
    static const vector<HeuristicKind> kinds = {
        HeuristicKind::Misplaced, HeuristicKind::Manhattan, HeuristicKind::LinearConflict
    };
    return kinds;
}
