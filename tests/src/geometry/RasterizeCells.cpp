#include <gtest/gtest.h>
#include "../utils/macros.h"

#include "rnaflux/geometry/RasterizeCells.hpp"
#include "../data/Simulator.hpp"

#include <cmath>

TEST(RasterizeCells, Square) {
    rnaflux::CellShapes cells;
    cells.push_back("A", make_square(0, 0, 20));

    rnaflux::RasterizeCells runner;
    runner.set_logger(rnaflux::null_logger());
    auto res = runner.run(cells);

    // All grid nodes on the boundary are included.
    EXPECT_EQ(res.points.size(), 21 * 21);
    EXPECT_TRUE(res.empty_cells.empty());
    EXPECT_TRUE(res.snapped_cells.empty());
    EXPECT_EQ(res.points.step, 1);

    for (size_t p = 0; p < res.points.size(); ++p) {
        EXPECT_EQ(res.points.cell[p], 0);
        EXPECT_EQ(res.points.x[p], std::round(res.points.x[p]));
        EXPECT_EQ(res.points.y[p], std::round(res.points.y[p]));
    }
}

TEST(RasterizeCells, GlobalAnchor) {
    // Grid is anchored at the origin, not at the cell's corner.
    rnaflux::CellShapes cells;
    cells.push_back("A", make_square(0.3, 0.7, 4));
    cells.push_back("B", make_square(10.1, 3.2, 4));

    rnaflux::RasterizeCells runner;
    runner.set_step(2).set_logger(rnaflux::null_logger());
    auto res = runner.run(cells);
    EXPECT_EQ(res.points.step, 2);

    for (size_t p = 0; p < res.points.size(); ++p) {
        EXPECT_EQ(std::fmod(res.points.x[p], 2.0), 0);
        EXPECT_EQ(std::fmod(res.points.y[p], 2.0), 0);
        EXPECT_TRUE(rnaflux::covers(cells.boundary[res.points.cell[p]], rnaflux::Point(res.points.x[p], res.points.y[p])));
    }

    // x in {2, 4}, y in {2, 4} for A; x in {12, 14}, y in {4, 6} for B.
    auto offsets = res.points.offsets(2);
    EXPECT_EQ(offsets[0], 0);
    EXPECT_EQ(offsets[1], 4);
    EXPECT_EQ(offsets[2], 8);
}

TEST(RasterizeCells, SmallAndEmptyCells) {
    rnaflux::CellShapes cells;
    cells.push_back("tiny", make_square(0.2, 0.2, 0.5));
    cells.push_back("empty", rnaflux::Polygon());
    cells.push_back("normal", make_square(5, 5, 2));

    rnaflux::RasterizeCells runner;
    runner.set_logger(rnaflux::null_logger());
    auto res = runner.run(cells);

    ASSERT_EQ(res.snapped_cells.size(), 1);
    EXPECT_EQ(res.snapped_cells[0], 0);
    ASSERT_EQ(res.empty_cells.size(), 1);
    EXPECT_EQ(res.empty_cells[0], 1);

    // Tiny cell is represented by its centroid snapped to the nearest grid node.
    auto offsets = res.points.offsets(3);
    EXPECT_EQ(offsets[1] - offsets[0], 1);
    EXPECT_EQ(res.points.x[0], 0);
    EXPECT_EQ(res.points.y[0], 0);

    EXPECT_EQ(offsets[2] - offsets[1], 0);
    EXPECT_EQ(offsets[3] - offsets[2], 9);
}

TEST(RasterizeCells, Parallel) {
    Simulator sim;
    auto data = sim.dataset(7);

    rnaflux::RasterizeCells runner;
    runner.set_step(0.7).set_logger(rnaflux::null_logger());
    auto ref = runner.run(data.cells);

    runner.set_num_threads(3);
    auto res = runner.run(data.cells);
    EXPECT_EQ(ref.points.cell, res.points.cell);
    EXPECT_EQ(ref.points.x, res.points.x);
    EXPECT_EQ(ref.points.y, res.points.y);
}

TEST(RasterizeCells, Errors) {
    rnaflux::CellShapes cells;
    cells.push_back("A", make_square(0, 0, 1));

    rnaflux::RasterizeCells runner;
    runner.set_step(0);
    EXPECT_ANY_THROW(runner.run(cells));
}
