#include <chrono>
#include <cstdint>
#include <functional>
#include <queue>
#include <stdexcept>
#include <unordered_map>
#include <vector>

#include "puzzle_errors.hpp"
#include "search_engine.hpp"

using namespace std;

string algorithm_name(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::BestFirst: return "best-first";
        case Algorithm::AStar: return "astar";
    }
    throw invalid_argument("Unknown algorithm");
}

Algorithm parse_algorithm(const string& name) {
    for (Algorithm algorithm : all_algorithms()) {
        if (algorithm_name(algorithm) == name) return algorithm;
    }
    throw invalid_argument("Unknown algorithm: " + name);
}

const vector<Algorithm>& all_algorithms() {
    static const vector<Algorithm> algorithms = {Algorithm::BestFirst, Algorithm::AStar};
    return algorithms;
}

OrderingPolicy ordering_policy(Algorithm algorithm) {
    return algorithm == Algorithm::BestFirst ? OrderingPolicy::ByHeuristic : OrderingPolicy::ByCostPlusHeuristic;
}

const char* outcome_name(SearchOutcome outcome) {
    switch (outcome) {
        case SearchOutcome::Solved: return "solved";
        case SearchOutcome::Exhausted: return "exhausted";
        case SearchOutcome::StepLimitReached: return "step limit reached";
    }
    return "?";
}

SearchEngine::SearchEngine(OrderingPolicy policy, int max_steps)
    : policy_(policy), max_steps_(max_steps) {
    if (max_steps <= 0) {
        throw invalid_argument("max_steps must be positive");
    }
}

OrderingPolicy SearchEngine::get_policy() const {
    return policy_;
}

int SearchEngine::get_max_steps() const {
    return max_steps_;
}

SearchResult SearchEngine::solve(const PuzzleState& start, const Heuristic& heuristic) const {
    if (!heuristic) {
        throw invalid_argument("A heuristic function is required");
    }
    if (!start.is_solvable()) {
        throw UnsolvableStateError("The puzzle is not solvable: " + start.to_string());
    }

    auto t0 = chrono::steady_clock::now();
    SearchResult result;

    NodeArena arena;
    priority_queue<FrontierEntry, vector<FrontierEntry>, greater<FrontierEntry>> frontier;
    // Best path cost at which each state was expanded
    unordered_map<PuzzleState, int> closed;
    uint64_t sequence = 0;

    NodeId root = arena.add(SearchNode(start, 0, heuristic(start), NO_PARENT, Move::Up));
    frontier.push({arena.at(root).ordering_key(policy_), sequence++, root});
    result.nodes_generated = 1;

    int steps = 0;
    while (!frontier.empty() && steps < max_steps_) {
        FrontierEntry top = frontier.top();
        frontier.pop();
        // Copied: adding children below may reallocate the arena
        const SearchNode current = arena.at(top.node);

        if (current.state.is_goal()) {
            result.solved = true;
            result.outcome = SearchOutcome::Solved;
            result.path = arena.path_to(top.node);
            break;
        }

        auto seen = closed.find(current.state);
        if (seen != closed.end() && seen->second <= current.path_cost) {
            continue;
        }
        closed[current.state] = current.path_cost;
        ++result.nodes_expanded;

        // Every neighbour is pushed and counted; stale copies are dropped when popped
        int child_cost = current.path_cost + 1;
        for (const auto& neighbor : current.state.neighbors()) {
            int estimate = heuristic(neighbor.second);
            NodeId child = arena.add(SearchNode(neighbor.second, child_cost, estimate, top.node, neighbor.first));
            frontier.push({arena.at(child).ordering_key(policy_), sequence++, child});
            ++result.nodes_generated;
        }
        ++steps;
    }

    if (!result.solved) {
        result.outcome = frontier.empty() ? SearchOutcome::Exhausted : SearchOutcome::StepLimitReached;
    }
    result.elapsed = chrono::steady_clock::now() - t0;
    return result;
}

SearchResult PuzzleSolve(const PuzzleState &start, const SearchConfig &config) {
    SearchEngine engine(ordering_policy(config.algorithm), config.max_steps);
    return engine.solve(start, make_heuristic(config.heuristic));
}

SearchResult PuzzleSolveAstar(const PuzzleState &start, HeuristicKind heuristic, int max_steps) {
    return PuzzleSolve(start, SearchConfig{Algorithm::AStar, heuristic, max_steps});
}

SearchResult PuzzleSolveBestFirst(const PuzzleState &start, HeuristicKind heuristic, int max_steps) {
    return PuzzleSolve(start, SearchConfig{Algorithm::BestFirst, heuristic, max_steps});
}
