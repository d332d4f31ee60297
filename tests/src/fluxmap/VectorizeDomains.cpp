#include <gtest/gtest.h>
#include "../utils/macros.h"

#include "rnaflux/fluxmap/VectorizeDomains.hpp"
#include "../utils/compare_almost_equal.h"

class VectorizeDomainsTest : public ::testing::Test {
protected:
    rnaflux::RasterPoints points;
    std::vector<int> labels;

    // Two cells: the first is a 5x5 grid split into left and right domains,
    // the second is a 3x3 grid with a single domain and an unassigned corner.
    void build(double step) {
        points = rnaflux::RasterPoints();
        points.step = step;
        labels.clear();

        for (int j = 0; j < 5; ++j) {
            for (int i = 0; i < 5; ++i) {
                points.push_back(0, i * step, j * step);
                labels.push_back(i < 2 ? 1 : 2);
            }
        }

        for (int j = 0; j < 3; ++j) {
            for (int i = 0; i < 3; ++i) {
                points.push_back(1, (i + 10) * step, j * step);
                labels.push_back(i == 0 && j == 0 ? 0 : 1);
            }
        }
    }
};

TEST_F(VectorizeDomainsTest, Basic) {
    build(1);
    rnaflux::VectorizeDomains vectorizer;
    auto res = vectorizer.run(points, labels.data(), 3, 2);
    EXPECT_TRUE(res.failed_cells.empty());
    const auto& layers = res.domains;

    ASSERT_EQ(layers.size(), 3);
    for (int l = 0; l < 3; ++l) {
        EXPECT_EQ(layers[l].label, l + 1);
        EXPECT_EQ(layers[l].geometry.size(), 2);
    }

    EXPECT_EQ(rnaflux::area(layers[0].geometry[0]), 10);
    EXPECT_EQ(rnaflux::area(layers[1].geometry[0]), 15);
    EXPECT_EQ(rnaflux::area(layers[0].geometry[1]), 8);

    // Domains without any raster points in a cell are empty placeholders.
    EXPECT_TRUE(layers[1].geometry[1].empty());
    EXPECT_TRUE(layers[2].geometry[0].empty());
    EXPECT_TRUE(layers[2].geometry[1].empty());

    // Each raster point lies within the domain of its own label.
    for (size_t p = 0; p < points.size(); ++p) {
        if (labels[p]) {
            rnaflux::Point loc(points.x[p], points.y[p]);
            EXPECT_TRUE(rnaflux::covers(layers[labels[p] - 1].geometry[points.cell[p]], loc));
        }
    }

    auto box = rnaflux::bounds(layers[0].geometry[0]);
    EXPECT_EQ(box.xmin, -0.5);
    EXPECT_EQ(box.xmax, 1.5);
    EXPECT_EQ(box.ymin, -0.5);
    EXPECT_EQ(box.ymax, 4.5);
}

TEST_F(VectorizeDomainsTest, Scaled) {
    build(0.5);
    rnaflux::VectorizeDomains vectorizer;
    auto layers = vectorizer.run(points, labels.data(), 2, 2).domains;
    ASSERT_EQ(layers.size(), 2);

    compare_almost_equal(rnaflux::area(layers[0].geometry[0]), 2.5);
    compare_almost_equal(rnaflux::area(layers[1].geometry[0]), 3.75);
    compare_almost_equal(rnaflux::area(layers[0].geometry[1]), 2.0);

    auto box = rnaflux::bounds(layers[1].geometry[0]);
    compare_almost_equal(box.xmin, 0.75);
    compare_almost_equal(box.xmax, 2.25);
}

TEST_F(VectorizeDomainsTest, EmptyCells) {
    build(1);
    rnaflux::VectorizeDomains vectorizer;
    auto layers = vectorizer.run(points, labels.data(), 2, 4).domains;
    ASSERT_EQ(layers.size(), 2);
    for (const auto& layer : layers) {
        ASSERT_EQ(layer.geometry.size(), 4);
        EXPECT_TRUE(layer.geometry[2].empty());
        EXPECT_TRUE(layer.geometry[3].empty());
    }
}

TEST_F(VectorizeDomainsTest, Parallel) {
    build(1);
    rnaflux::VectorizeDomains vectorizer;
    auto ref = vectorizer.run(points, labels.data(), 2, 2).domains;

    vectorizer.set_num_threads(2);
    auto par = vectorizer.run(points, labels.data(), 2, 2).domains;
    for (size_t l = 0; l < ref.size(); ++l) {
        for (size_t c = 0; c < 2; ++c) {
            ASSERT_EQ(ref[l].geometry[c].size(), par[l].geometry[c].size());
            for (size_t i = 0; i < ref[l].geometry[c].size(); ++i) {
                EXPECT_EQ(ref[l].geometry[c][i].exterior, par[l].geometry[c][i].exterior);
            }
        }
    }
}

TEST_F(VectorizeDomainsTest, FailedCells) {
    build(1);
    rnaflux::VectorizeDomains vectorizer;
    vectorizer.set_max_pixels(20);
    auto res = vectorizer.run(points, labels.data(), 2, 2);

    // The first cell's 5x5 image is too large, but the second cell is still traced.
    ASSERT_EQ(res.failed_cells.size(), 1);
    EXPECT_EQ(res.failed_cells[0].first, 0);
    EXPECT_FALSE(res.failed_cells[0].second.empty());

    ASSERT_EQ(res.domains.size(), 2);
    EXPECT_TRUE(res.domains[0].geometry[0].empty());
    EXPECT_TRUE(res.domains[1].geometry[0].empty());
    EXPECT_EQ(rnaflux::area(res.domains[0].geometry[1]), 8);

    // Same results in parallel.
    vectorizer.set_num_threads(2);
    auto par = vectorizer.run(points, labels.data(), 2, 2);
    ASSERT_EQ(par.failed_cells.size(), 1);
    EXPECT_EQ(par.failed_cells[0].first, 0);
    EXPECT_EQ(rnaflux::area(par.domains[0].geometry[1]), 8);
}

TEST_F(VectorizeDomainsTest, Errors) {
    build(1);
    rnaflux::VectorizeDomains vectorizer;
    EXPECT_ANY_THROW(vectorizer.run(points, labels.data(), 1, 2));
    EXPECT_ANY_THROW(vectorizer.run(points, labels.data(), 2, 1));

    points.step = 0;
    EXPECT_ANY_THROW(vectorizer.run(points, labels.data(), 2, 2));
}
