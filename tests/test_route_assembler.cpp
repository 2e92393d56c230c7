#include <gtest/gtest.h>
#include "errors.hpp"
#include "matrix_builder.hpp"
#include "route_assembler.hpp"
#include "solver.hpp"

class RouteAssemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        depot = {{40.7128, -74.0060}, "depot"};
        stops = {
            {{40.7589, -73.9851}, "a", 1},
            {{40.6892, -74.0445}, "b", 2, 15.0},
            {{40.7505, -73.9934}, "c", 3},
        };
        m = build_matrices(depot.location, stops, 1.3, 1.1);
    }

    Stop depot;
    std::vector<Stop> stops;
    CostMatrix m;
};

TEST_F(RouteAssemblerTest, LegsComeFromMatrices) {
    std::vector<int> seq = {0, 3, 1, 2};
    Route r = assemble_route(seq, m, depot, stops);

    ASSERT_EQ(r.stops.size(), 4u);
    EXPECT_EQ(r.sequence, seq);
    EXPECT_EQ(r.stops[0].stop.id, "depot");
    EXPECT_EQ(r.stops[0].distance_from_previous, 0.0);

    for (int i = 1; i < 4; i++) {
        EXPECT_EQ(r.stops[i].sequence, i);
        EXPECT_EQ(r.stops[i].node, seq[i]);
        EXPECT_EQ(r.stops[i].distance_from_previous, m.distance_km[seq[i - 1]][seq[i]]);
        EXPECT_EQ(r.stops[i].time_from_previous, m.time_minutes[seq[i - 1]][seq[i]]);
    }
    EXPECT_EQ(r.stops[1].stop.id, "c");
    EXPECT_EQ(r.stops[3].stop.id, "b");
    EXPECT_EQ(r.stops[3].stop.service_time_minutes.value_or(0), 15.0);
}

TEST_F(RouteAssemblerTest, TotalsMatchSumOfLegs) {
    std::vector<int> seq = {0, 2, 3, 1};
    Route r = assemble_route(seq, m, depot, stops);

    EXPECT_DOUBLE_EQ(r.total_distance_km, path_cost(m.distance_km, seq));
    EXPECT_DOUBLE_EQ(r.total_time_minutes, path_cost(m.time_minutes, seq));
    EXPECT_DOUBLE_EQ(r.stops.back().cumulative_distance_km, r.total_distance_km);
    EXPECT_DOUBLE_EQ(r.stops.back().cumulative_time_minutes, r.total_time_minutes);
}

TEST_F(RouteAssemblerTest, RejectsBrokenSequences) {
    EXPECT_THROW(assemble_route({0, 1, 2}, m, depot, stops), AssemblyInvariantViolation);
    EXPECT_THROW(assemble_route({1, 0, 2, 3}, m, depot, stops), AssemblyInvariantViolation);
    EXPECT_THROW(assemble_route({0, 1, 1, 2}, m, depot, stops), AssemblyInvariantViolation);
    EXPECT_THROW(assemble_route({0, 1, 2, 4}, m, depot, stops), AssemblyInvariantViolation);
    EXPECT_THROW(assemble_route({}, m, depot, stops), AssemblyInvariantViolation);
}

TEST_F(RouteAssemblerTest, RejectsStopCountMismatch) {
    std::vector<Stop> fewer(stops.begin(), stops.begin() + 2);
    EXPECT_THROW(assemble_route({0, 1, 2, 3}, m, depot, fewer), OptimizationError);
}
