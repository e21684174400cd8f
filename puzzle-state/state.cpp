#include <algorithm>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "puzzle_errors.hpp"
#include "state.hpp"

using namespace std;

namespace {

const Move ALL_MOVES[] = {Move::Up, Move::Down, Move::Left, Move::Right};
const int NUM_DIRECTIONS = 4;

}

const char* move_name(Move move) {
    switch (move) {
        case Move::Up: return "up";
        case Move::Down: return "down";
        case Move::Left: return "left";
        case Move::Right: return "right";
    }
    return "?";
}

Move parse_move(const string& name) {
    for (Move move : ALL_MOVES) {
        if (name == move_name(move)) return move;
    }
    throw invalid_argument("Unknown move: " + name);
}

NeighborIterator::NeighborIterator(const PuzzleState* state, int direction)
    : state_(state), direction_(direction) {
    skip_illegal();
}

NeighborIterator::value_type NeighborIterator::operator*() const {
    Move move = ALL_MOVES[direction_];
    return {move, state_->apply_move(move)};
}

NeighborIterator& NeighborIterator::operator++() {
    ++direction_;
    skip_illegal();
    return *this;
}

NeighborIterator NeighborIterator::operator++(int) {
    NeighborIterator previous = *this;
    ++(*this);
    return previous;
}

bool NeighborIterator::operator==(const NeighborIterator& rhs) const {
    return state_ == rhs.state_ && direction_ == rhs.direction_;
}

bool NeighborIterator::operator!=(const NeighborIterator& rhs) const {
    return !(*this == rhs);
}

void NeighborIterator::skip_illegal() {
    while (direction_ < NUM_DIRECTIONS && !state_->can_move(ALL_MOVES[direction_])) {
        ++direction_;
    }
}

NeighborIterator NeighborRange::begin() const {
    return NeighborIterator(state_, 0);
}

NeighborIterator NeighborRange::end() const {
    return NeighborIterator(state_, NUM_DIRECTIONS);
}

void PuzzleState::init(const vector<int>& tiles) {
    int side_length;
    if (tiles.size() == 9) {
        side_length = 3;
    } else if (tiles.size() == 16) {
        side_length = 4;
    } else {
        throw InvalidStateError("State must have exactly 9 elements (8-puzzle) or 16 elements (15-puzzle)");
    }
    int num_cells = side_length * side_length;
    vector<bool> seen(num_cells, false);
    int blank_position = -1;
    for (int i = 0; i < num_cells; ++i) {
        if (tiles[i] < 0 || tiles[i] >= num_cells) {
            throw InvalidStateError("Tile values must be in range [0," + std::to_string(num_cells - 1) + "]");
        }
        if (seen[tiles[i]]) {
            throw InvalidStateError("Duplicate tile value " + std::to_string(tiles[i]));
        }
        seen[tiles[i]] = true;
        if (tiles[i] == 0) blank_position = i;
    }
    this->side_length = side_length;
    this->tiles = tiles;
    this->blank_position = blank_position;
}

PuzzleState::PuzzleState(const vector<int>& tiles) {
    init(tiles);
}

PuzzleState PuzzleState::from_string(const string& text) {
    istringstream in(text);
    vector<int> tiles;
    string token;
    while (in >> token) {
        size_t consumed = 0;
        int value;
        try {
            value = stoi(token, &consumed);
        } catch (const logic_error&) {
            throw InvalidStateError("Invalid state string format: " + text);
        }
        if (consumed != token.size()) {
            throw InvalidStateError("Invalid state string format: " + text);
        }
        tiles.push_back(value);
    }
    return PuzzleState(tiles);
}

PuzzleState PuzzleState::goal(int side_length) {
    if (side_length != 3 && side_length != 4) {
        throw InvalidStateError("Only 3x3 and 4x4 boards are supported");
    }
    int num_cells = side_length * side_length;
    vector<int> tiles(num_cells);
    for (int i = 0; i < num_cells - 1; ++i) tiles[i] = i + 1;
    tiles[num_cells - 1] = 0;
    return PuzzleState(tiles);
}

size_t PuzzleState::hash() const {
    // FNV-1a over the tile values
    size_t h = 1469598103934665603ULL; // FNV offset
    h ^= static_cast<size_t>(side_length);
    h *= 1099511628211ULL;
    for (int v : tiles) {
        h ^= static_cast<size_t>(v + 1);
        h *= 1099511628211ULL; // FNV prime
    }
    return h;
}

int PuzzleState::get_side_length() const {
    return side_length;
}

int PuzzleState::get_num_cells() const {
    return side_length * side_length;
}

const vector<int>& PuzzleState::get_tiles() const {
    return tiles;
}

int PuzzleState::get_tile(int position) const {
    return tiles[position];
}

int PuzzleState::get_blank_position() const {
    return blank_position;
}

int PuzzleState::get_blank_row() const {
    return blank_position / side_length;
}

int PuzzleState::get_blank_column() const {
    return blank_position % side_length;
}

vector<Move> PuzzleState::get_legal_moves() const {
    vector<Move> moves;
    for (Move move : ALL_MOVES) {
        if (can_move(move)) moves.push_back(move);
    }
    return moves;
}

bool PuzzleState::can_move(Move move) const {
    switch (move) {
        case Move::Up: return get_blank_row() > 0;
        case Move::Down: return get_blank_row() < side_length - 1;
        case Move::Left: return get_blank_column() > 0;
        case Move::Right: return get_blank_column() < side_length - 1;
    }
    return false;
}

PuzzleState PuzzleState::apply_move(Move move) const {
    if (!can_move(move)) {
        throw InvalidStateError(string("Illegal move: ") + move_name(move));
    }
    int swap_position = blank_position;
    switch (move) {
        case Move::Up: swap_position -= side_length; break;
        case Move::Down: swap_position += side_length; break;
        case Move::Left: swap_position -= 1; break;
        case Move::Right: swap_position += 1; break;
    }
    // The copy keeps this state's tiles untouched
    PuzzleState next = *this;
    swap(next.tiles[blank_position], next.tiles[swap_position]);
    next.blank_position = swap_position;
    return next;
}

NeighborRange PuzzleState::neighbors() const {
    return NeighborRange(this);
}

bool PuzzleState::is_goal() const {
    int num_cells = get_num_cells();
    for (int i = 0; i < num_cells - 1; ++i) {
        if (tiles[i] != i + 1) return false;
    }
    return tiles[num_cells - 1] == 0;
}

int PuzzleState::count_inversions() const {
    int inversions = 0;
    int num_cells = get_num_cells();
    for (int i = 0; i < num_cells; ++i) {
        if (tiles[i] == 0) continue;
        for (int j = i + 1; j < num_cells; ++j) {
            if (tiles[j] != 0 && tiles[i] > tiles[j]) ++inversions;
        }
    }
    return inversions;
}

bool PuzzleState::is_solvable() const {
    int inversions = count_inversions();
    if (side_length % 2 == 1) {
        return inversions % 2 == 0;
    }
    int blank_rows_from_bottom = side_length - 1 - get_blank_row();
    return (inversions + blank_rows_from_bottom) % 2 == 0;
}

string PuzzleState::to_string() const {
    ostringstream out;
    for (size_t i = 0; i < tiles.size(); ++i) {
        if (i) out << ' ';
        out << tiles[i];
    }
    return out.str();
}

string PuzzleState::to_grid_string() const {
    ostringstream out;
    for (int row = 0; row < side_length; ++row) {
        if (row) out << '\n';
        for (int col = 0; col < side_length; ++col) {
            if (col) out << ' ';
            int tile = tiles[row * side_length + col];
            if (tile == 0) {
                out << 'b';
            } else {
                out << tile;
            }
        }
    }
    return out.str();
}

bool PuzzleState::operator==(const PuzzleState &rhs) const {
    if (side_length != rhs.side_length) return false;
    return tiles == rhs.tiles;
}

bool PuzzleState::operator!=(const PuzzleState &rhs) const {
    return !(*this == rhs);
}

bool PuzzleState::operator<(const PuzzleState &rhs) const {
    if (side_length != rhs.side_length) return side_length < rhs.side_length;
    return tiles < rhs.tiles;
}

vector<PuzzleState> replay_moves(const PuzzleState& start, const vector<Move>& moves) {
    vector<PuzzleState> states;
    states.reserve(moves.size() + 1);
    states.push_back(start);
    for (Move move : moves) {
        states.push_back(states.back().apply_move(move));
    }
    return states;
}
