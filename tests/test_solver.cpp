#include <gtest/gtest.h>
#include <cmath>
#include <random>
#include <string>
#include "matrix_builder.hpp"
#include "solver.hpp"

// Nodes on a line; travel time is distance times time_factor.
static CostMatrix line_matrices(const std::vector<double>& xs, double time_factor = 1.0)
{
    int n = xs.size();
    CostMatrix m;
    m.distance_km.assign(n, std::vector<double>(n, 0.0));
    m.time_minutes.assign(n, std::vector<double>(n, 0.0));
    for (int i = 0; i < n; i++) {
        for (int j = 0; j < n; j++) {
            m.distance_km[i][j] = std::fabs(xs[i] - xs[j]);
            m.time_minutes[i][j] = m.distance_km[i][j] * time_factor;
        }
    }
    return m;
}

static CostMatrix random_city(unsigned seed, int stops)
{
    std::mt19937 rng(seed);
    std::uniform_real_distribution<double> lat(40.60, 40.85), lng(-74.10, -73.85);
    std::vector<Stop> dests;
    for (int i = 0; i < stops; i++)
        dests.push_back({{lat(rng), lng(rng)}, "s" + std::to_string(i)});
    return build_matrices({40.7128, -74.0060}, dests, 1.2, 1.1);
}

TEST(NearestNeighbor, PicksClosestUnvisited) {
    auto m = line_matrices({0, 5, 1, 3});
    EXPECT_EQ(nearest_neighbor_sequence(m.distance_km), (std::vector<int>{0, 2, 3, 1}));
}

TEST(NearestNeighbor, TiesGoToLowestIndex) {
    auto m = line_matrices({0, 1, -1});
    EXPECT_EQ(nearest_neighbor_sequence(m.distance_km), (std::vector<int>{0, 1, 2}));
}

TEST(NearestNeighbor, DepotOnly) {
    auto m = line_matrices({0});
    EXPECT_EQ(nearest_neighbor_sequence(m.distance_km), (std::vector<int>{0}));
}

TEST(PathCost, OpenPathWithoutReturnLeg) {
    auto m = line_matrices({0, 1, -2, 10});
    EXPECT_DOUBLE_EQ(path_cost(m.distance_km, {0, 1, 2, 3}), 16.0);
    EXPECT_DOUBLE_EQ(path_cost(m.distance_km, {0}), 0.0);
}

TEST(DepotPermutation, Checks) {
    EXPECT_TRUE(is_depot_permutation({0, 2, 1}, 3));
    EXPECT_FALSE(is_depot_permutation({1, 0, 2}, 3));
    EXPECT_FALSE(is_depot_permutation({0, 1, 1}, 3));
    EXPECT_FALSE(is_depot_permutation({0, 1}, 3));
    EXPECT_FALSE(is_depot_permutation({0, 1, 3}, 3));
}

TEST(GreedySolver, TaggedAsFallbackAndIgnoresConstraints) {
    auto m = line_matrices({0, 5, 1, 3});
    SolveInput in{m};
    in.constraints.max_capacity = 1;

    GreedyRouteSolver solver;
    auto out = solver.solve(in);
    EXPECT_EQ(out.quality, Quality::HeuristicFallback);
    EXPECT_EQ(out.status, SolveStatus::Fallback);
    EXPECT_EQ(out.sequence, (std::vector<int>{0, 2, 3, 1}));
}

TEST(SearchSolver, ImprovesOnGreedyConstruction) {
    // Greedy goes 0 -> 1 -> -2 -> 10 (16); the best open path is 0 -> -2 -> 1 -> 10 (14).
    auto m = line_matrices({0, 1, -2, 10});
    SolveInput in{m};
    in.optimize_for = OptimizeFor::Distance;

    SearchRouteSolver solver;
    auto out = solver.solve(in);
    EXPECT_EQ(out.sequence, (std::vector<int>{0, 2, 1, 3}));
    EXPECT_EQ(out.quality, Quality::Optimal);
    EXPECT_EQ(out.status, SolveStatus::Converged);
    EXPECT_DOUBLE_EQ(out.cost, 14.0);
}

TEST(SearchSolver, ReturnsDepotFirstPermutation) {
    auto m = random_city(7, 25);
    SolveInput in{m};

    SearchRouteSolver solver;
    auto out = solver.solve(in);
    EXPECT_TRUE(is_depot_permutation(out.sequence, m.size()));
}

TEST(SearchSolver, NeverWorseThanFallback) {
    for (unsigned seed = 1; seed <= 10; seed++) {
        auto m = random_city(seed, 15);
        for (auto pref : {OptimizeFor::Time, OptimizeFor::Distance}) {
            SolveInput in{m};
            in.optimize_for = pref;

            auto search = SearchRouteSolver().solve(in);
            ASSERT_EQ(search.quality, Quality::Optimal);

            const Matrix& active = active_matrix(m, pref);
            double greedy = path_cost(active, nearest_neighbor_sequence(m.distance_km));
            EXPECT_LE(search.cost, greedy) << "seed " << seed;
            EXPECT_DOUBLE_EQ(search.cost, path_cost(active, search.sequence));
        }
    }
}

TEST(SearchSolver, Deterministic) {
    auto m = random_city(42, 20);
    SolveInput in{m};

    auto a = SearchRouteSolver().solve(in);
    auto b = SearchRouteSolver().solve(in);
    EXPECT_EQ(a.sequence, b.sequence);
    EXPECT_EQ(a.cost, b.cost);
}

TEST(SearchSolver, NoDestinationsIsNonConvergent) {
    auto m = line_matrices({0});
    SolveInput in{m};

    auto out = SearchRouteSolver().solve(in);
    EXPECT_EQ(out.status, SolveStatus::NonConvergent);
    EXPECT_TRUE(out.sequence.empty());
}

TEST(SearchSolver, CapacityBelowStopCountIsNonConvergent) {
    auto m = line_matrices({0, 1, 2});
    SolveInput in{m};
    in.constraints.max_capacity = 1;

    auto out = SearchRouteSolver().solve(in);
    EXPECT_EQ(out.status, SolveStatus::NonConvergent);
    EXPECT_TRUE(out.sequence.empty());
}

TEST(SearchSolver, CapacityCoveringAllStops) {
    auto m = line_matrices({0, 1, 2});
    SolveInput in{m};
    in.constraints.max_capacity = 2;

    auto out = SearchRouteSolver().solve(in);
    EXPECT_EQ(out.quality, Quality::Optimal);
    EXPECT_EQ(out.sequence, (std::vector<int>{0, 1, 2}));
}

TEST(SearchSolver, DurationLimitTolerance) {
    // 0 -> 100 -> 200 takes 200 minutes.
    auto m = line_matrices({0, 100, 200});
    SolveInput in{m};
    in.constraints.max_duration_minutes = 180;

    in.waiting_slack_minutes = 30;
    EXPECT_EQ(SearchRouteSolver().solve(in).status, SolveStatus::Converged);

    in.waiting_slack_minutes = 0;
    EXPECT_EQ(SearchRouteSolver().solve(in).status, SolveStatus::NonConvergent);
}

TEST(SearchSolver, DurationCountsServiceTime) {
    auto m = line_matrices({0, 10, 20});
    SolveInput in{m};
    in.constraints.max_duration_minutes = 100;
    in.waiting_slack_minutes = 0;

    EXPECT_EQ(SearchRouteSolver().solve(in).status, SolveStatus::Converged);

    in.service_minutes = {0, 45, 45};
    EXPECT_EQ(SearchRouteSolver().solve(in).status, SolveStatus::NonConvergent);
}

TEST(SearchSolver, DurationUsesTimeMatrixWhenOptimizingDistance) {
    // Distances are small but every minute counts triple.
    auto m = line_matrices({0, 20, 40}, 3.0);
    SolveInput in{m};
    in.optimize_for = OptimizeFor::Distance;
    in.constraints.max_duration_minutes = 60;
    in.waiting_slack_minutes = 0;

    EXPECT_EQ(SearchRouteSolver().solve(in).status, SolveStatus::NonConvergent);
}

TEST(SearchSolver, DurationIsNotTruncated) {
    // Two legs of 50.005 minutes overshoot a 100 minute limit.
    auto m = line_matrices({0, 50.005, 100.01});
    SolveInput in{m};
    in.constraints.max_duration_minutes = 100;
    in.waiting_slack_minutes = 0;

    EXPECT_EQ(SearchRouteSolver().solve(in).status, SolveStatus::NonConvergent);
}

TEST(SearchSolver, HugeTravelTimesStayInfeasible) {
    std::vector<Stop> dests = {
        {{40.7589, -73.9851}, "a"},
        {{40.7484, -73.9857}, "b"},
        {{40.7061, -74.0087}, "c"},
    };
    auto m = build_matrices({40.7128, -74.0060}, dests, 1e20, 1.0);
    SolveInput in{m};
    in.constraints.max_duration_minutes = 60;

    auto out = SearchRouteSolver().solve(in);
    EXPECT_EQ(out.status, SolveStatus::NonConvergent);
    EXPECT_TRUE(out.sequence.empty());

    in.constraints.max_duration_minutes.reset();
    out = SearchRouteSolver().solve(in);
    EXPECT_EQ(out.quality, Quality::Optimal);
    EXPECT_TRUE(is_depot_permutation(out.sequence, m.size()));
}

TEST(SearchSolver, TinyDeadlineStillTerminates) {
    auto m = random_city(3, 40);
    SolveInput in{m};
    in.time_limit_seconds = 1e-6;

    auto out = SearchRouteSolver().solve(in);
    if (out.status == SolveStatus::NonConvergent) {
        EXPECT_TRUE(out.sequence.empty());
    } else {
        EXPECT_TRUE(is_depot_permutation(out.sequence, m.size()));
    }
}

TEST(SolverFactory, SelectsStrategy) {
    EXPECT_STREQ(make_solver(SolverStrategy::Search)->name(), "search");
    EXPECT_STREQ(make_solver(SolverStrategy::Greedy)->name(), "greedy");
}
