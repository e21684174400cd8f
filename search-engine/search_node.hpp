#ifndef __SEARCH_NODE_HPP___
#define __SEARCH_NODE_HPP___

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <utility>
#include <vector>

#include "state.hpp"

/**
 * @file search_node.hpp
 * @brief Search tree bookkeeping: nodes, the per-search arena and frontier entries.
 */

/**
 * @brief Frontier ordering key selection.
 *
 * ByHeuristic orders by h alone (Best-First), ByCostPlusHeuristic by g + h (A*).
 */
enum class OrderingPolicy { ByHeuristic, ByCostPlusHeuristic };

using NodeId = std::size_t;

const NodeId NO_PARENT = std::numeric_limits<NodeId>::max();

/**
 * @brief One generated state with its path cost, estimate and parent link.
 *
 * The parent is an index into the owning NodeArena. `move` is the blank move
 * that produced the state from its parent and is meaningless for the root.
 */
struct SearchNode {
    PuzzleState state;
    int path_cost;
    int estimate;
    NodeId parent;
    Move move;

    SearchNode(const PuzzleState& s, int g, int h, NodeId p, Move m)
        : state(s), path_cost(g), estimate(h), parent(p), move(m) {}

    // Every move costs 1, so the depth in the search tree is the path cost.
    int depth() const {
        return path_cost;
    }

    int ordering_key(OrderingPolicy policy) const {
        return policy == OrderingPolicy::ByHeuristic ? estimate : path_cost + estimate;
    }
};

/**
 * @brief Owns every node generated during one search.
 *
 * Nodes are never removed, so ids stay valid until the arena is destroyed
 * together with the search that created it.
 */
class NodeArena {
public:
    NodeId add(SearchNode node) {
        nodes_.push_back(std::move(node));
        return nodes_.size() - 1;
    }

    const SearchNode& at(NodeId id) const {
        return nodes_.at(id);
    }

    std::size_t size() const {
        return nodes_.size();
    }

    // Moves from the root to `id`, following parent links.
    std::vector<Move> path_to(NodeId id) const {
        std::vector<Move> moves;
        for (NodeId current = id; nodes_.at(current).parent != NO_PARENT; current = nodes_.at(current).parent) {
            moves.push_back(nodes_.at(current).move);
        }
        std::reverse(moves.begin(), moves.end());
        return moves;
    }

private:
    std::vector<SearchNode> nodes_;
};

/**
 * @brief Priority queue entry; `sequence` breaks ties in insertion order.
 */
struct FrontierEntry {
    int key;
    std::uint64_t sequence;
    NodeId node;

    bool operator>(const FrontierEntry& rhs) const {
        if (key != rhs.key) return key > rhs.key;
        return sequence > rhs.sequence;
    }
};

#endif // __SEARCH_NODE_HPP___
