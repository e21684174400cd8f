/**
 * @file state.hpp
 * @brief Sliding-tile board state (8-puzzle and 15-puzzle).
 *
 * This header declares the PuzzleState class used by the heuristics, the
 * search engine and the experiment tools.
 */

#ifndef __STATE_HPP___
#define __STATE_HPP___

#include <cstddef>
#include <functional>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Direction the blank travels when a move is applied.
 */
enum class Move { Up, Down, Left, Right };

/**
 * @brief Lower-case name of a move ("up", "down", "left", "right").
 */
const char* move_name(Move move);

/**
 * @brief Parse a move name as produced by move_name().
 * @throws std::invalid_argument for any other string.
 */
Move parse_move(const std::string& name);

class PuzzleState;

/**
 * @brief Forward iterator over the (move, successor) pairs of a state.
 *
 * Successors are computed on dereference; the iterated state is never modified.
 */
class NeighborIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = std::pair<Move, PuzzleState>;
    using difference_type = std::ptrdiff_t;
    using pointer = const value_type*;
    using reference = value_type;

    NeighborIterator(const PuzzleState* state, int direction);

    value_type operator*() const;
    NeighborIterator& operator++();
    NeighborIterator operator++(int);
    bool operator==(const NeighborIterator& rhs) const;
    bool operator!=(const NeighborIterator& rhs) const;

private:
    const PuzzleState* state_;
    int direction_;

    void skip_illegal();
};

/**
 * @brief Restartable view over the successors of a state.
 *
 * The range borrows the state it was created from, which must outlive it.
 */
class NeighborRange {
public:
    explicit NeighborRange(const PuzzleState* state) : state_(state) {}

    NeighborIterator begin() const;
    NeighborIterator end() const;

private:
    const PuzzleState* state_;
};

/**
 * @brief Immutable N-puzzle board stored as a row-major tile sequence.
 *
 * Tile value 0 denotes the blank. The goal layout is 1..N*N-1 followed by the
 * blank in the bottom-right cell. Every operation that moves a tile returns a
 * new state, so many historical states can be held at once.
 */
class PuzzleState {

private:
    std::vector<int> tiles;
    int side_length;
    int blank_position;
    void init(const std::vector<int>& tiles);
public:
    /**
     * @brief Construct a state from tile values in row-major order.
     *
     * The side length is inferred from the tile count (9 -> 3x3, 16 -> 4x4).
     *
     * @param tiles Permutation of 0..N*N-1, 0 being the blank.
     * @throws InvalidStateError on wrong length, out-of-range or duplicate values.
     */
    explicit PuzzleState(const std::vector<int>& tiles);
    ~PuzzleState() = default;

    // Rule of five
    PuzzleState(const PuzzleState& other) = default;
    PuzzleState& operator=(const PuzzleState& other) = default;
    PuzzleState(PuzzleState&& other) = default;
    PuzzleState& operator=(PuzzleState&& other) = default;

    /**
     * @brief Parse a whitespace separated state such as "4 5 0 6 1 8 7 3 2".
     * @throws InvalidStateError if a token is not an integer or the board is invalid.
     */
    static PuzzleState from_string(const std::string& text);

    /**
     * @brief Canonical solved board for the given side length (3 or 4).
     * @throws InvalidStateError for unsupported side lengths.
     */
    static PuzzleState goal(int side_length);

    /**
     * @brief Compute a stable hash of the tile sequence.
     *
     * Equal states hash equal, so the value is suitable for unordered containers.
     */
    size_t hash() const;

    int get_side_length() const;
    int get_num_cells() const;
    const std::vector<int>& get_tiles() const;

    /**
     * @brief Tile value stored at a cell (row-major index).
     */
    int get_tile(int position) const;

    /**
     * @brief Row-major index of the blank.
     */
    int get_blank_position() const;
    int get_blank_row() const;
    int get_blank_column() const;

    /**
     * @brief Moves of the blank that stay on the board, in up/down/left/right order.
     */
    std::vector<Move> get_legal_moves() const;

    /**
     * @brief Whether the blank can travel in the given direction.
     */
    bool can_move(Move move) const;

    /**
     * @brief Swap the blank with the adjacent tile in the given direction.
     *
     * @return A new state; this state is left unchanged.
     * @throws InvalidStateError if the move would leave the board.
     */
    PuzzleState apply_move(Move move) const;

    /**
     * @brief Lazily generate up to four (move, successor) pairs.
     *
     * Nothing is cached: every call (and every pass over the range) recomputes
     * the successors from the current tiles.
     */
    NeighborRange neighbors() const;

    /**
     * @brief True iff the tiles are in ascending order with the blank last.
     */
    bool is_goal() const;

    /**
     * @brief Number of tile pairs (blank excluded) that appear in reverse order.
     */
    int count_inversions() const;

    /**
     * @brief Parity test deciding whether the goal is reachable.
     *
     * Odd widths: solvable iff the inversion count is even. Even widths:
     * solvable iff inversions plus the blank's row distance from the last row
     * is even.
     */
    bool is_solvable() const;

    /**
     * @brief Space separated tile values, e.g. "1 2 3 4 5 6 7 8 0".
     */
    std::string to_string() const;

    /**
     * @brief One line per row with "b" for the blank.
     */
    std::string to_grid_string() const;

    /**
     * @brief Equality comparison (same side length and same tile sequence).
     */
    bool operator==(const PuzzleState &rhs) const;
    bool operator!=(const PuzzleState &rhs) const;

    /**
     * @brief Strict weak ordering used for ordered containers (std::set).
     */
    bool operator<(const PuzzleState &rhs) const;
};

/**
 * @brief Apply a move sequence to a start state.
 *
 * @return Every visited state, start first, so the result holds moves.size() + 1 states.
 * @throws InvalidStateError if one of the moves is illegal at its point in the sequence.
 */
std::vector<PuzzleState> replay_moves(const PuzzleState& start, const std::vector<Move>& moves);

namespace std {
template <>
struct hash<PuzzleState> {
    size_t operator()(const PuzzleState& state) const noexcept {
        return state.hash();
    }
};
}

#endif // __STATE_HPP___
