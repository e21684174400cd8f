// Google Test for the ctypes-facing C API
#include <gtest/gtest.h>

extern "C" int solver_run_instance(const char* state, const char* algorithm, const char* heuristic, int max_steps,
                                   double* out_time_ms, int* out_steps, long* out_expanded, long* out_generated);

namespace {

struct ApiCall {
    double time_ms = -1.0;
    int steps = -1;
    long expanded = -1;
    long generated = -1;

    int run(const char* state, const char* algorithm, const char* heuristic, int max_steps) {
        return solver_run_instance(state, algorithm, heuristic, max_steps, &time_ms, &steps, &expanded, &generated);
    }
};

}

TEST(SolverApi, Solved) {
    ApiCall call;
    EXPECT_EQ(call.run("1 2 3 4 0 8 7 6 5", "astar", "linear_conflict", 10000), 1);
    EXPECT_EQ(call.steps, 6);
    EXPECT_GT(call.expanded, 0);
    EXPECT_GT(call.generated, call.expanded);
    EXPECT_GE(call.time_ms, 0.0);
}

TEST(SolverApi, BestFirstSolved) {
    ApiCall call;
    EXPECT_EQ(call.run("1 2 3 4 5 6 7 0 8", "best-first", "misplaced", 10), 1);
    EXPECT_EQ(call.steps, 1);
    EXPECT_EQ(call.expanded, 1);
}

TEST(SolverApi, StepLimitIsNotAnError) {
    ApiCall call;
    EXPECT_EQ(call.run("8 6 7 2 5 4 3 0 1", "astar", "misplaced", 5), 0);
    EXPECT_EQ(call.steps, 0);
    EXPECT_EQ(call.expanded, 5);
}

TEST(SolverApi, BadArguments) {
    ApiCall call;
    EXPECT_EQ(call.run(nullptr, "astar", "manhattan", 100), -1);
    EXPECT_EQ(call.run("1 2 3 4 0 8 7 6 5", "ida", "manhattan", 100), -1);
    EXPECT_EQ(call.run("1 2 3 4 0 8 7 6 5", "astar", "euclidean", 100), -1);
    EXPECT_EQ(call.run("1 2 3 4 0 8 7 6 5", "astar", "manhattan", 0), -1);

    double time_ms = 0.0;
    int steps = 0;
    long expanded = 0;
    EXPECT_EQ(solver_run_instance("1 2 3 4 0 8 7 6 5", "astar", "manhattan", 100, &time_ms, &steps, &expanded, nullptr), -1);
}

TEST(SolverApi, InvalidState) {
    ApiCall call;
    EXPECT_EQ(call.run("1 2 3 4 5 6 7 8", "astar", "manhattan", 100), -2);
    EXPECT_EQ(call.run("1 2 3 4 5 6 7 8 8", "astar", "manhattan", 100), -2);
    EXPECT_EQ(call.run("a b c", "astar", "manhattan", 100), -2);
}

TEST(SolverApi, UnsolvableState) {
    ApiCall call;
    EXPECT_EQ(call.run("8 1 2 0 4 3 7 6 5", "astar", "manhattan", 100), -3);
    EXPECT_EQ(call.run("4 5 0 6 1 8 7 3 2", "best-first", "misplaced", 100), -3);
}
