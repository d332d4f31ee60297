#include <gtest/gtest.h>
#include "../utils/macros.h"

#include "rnaflux/geometry/TraceLabelImage.hpp"

#include <vector>

struct LabelImage {
    std::vector<int> x, y, labels;

    void add(int x_, int y_, int l) {
        x.push_back(x_);
        y.push_back(y_);
        labels.push_back(l);
    }

    rnaflux::TraceLabelImage::Results trace() const {
        rnaflux::TraceLabelImage tracer;
        return tracer.run(x.size(), x.data(), y.data(), labels.data());
    }
};

TEST(TraceLabelImage, SingleBlock) {
    LabelImage img;
    for (int i = 0; i < 3; ++i) {
        for (int j = 0; j < 2; ++j) {
            img.add(i, j, 1);
        }
    }

    auto res = img.trace();
    ASSERT_EQ(res.labels.size(), 1);
    EXPECT_EQ(res.labels[0], 1);
    ASSERT_EQ(res.shapes[0].size(), 1);

    const auto& poly = res.shapes[0][0];
    EXPECT_TRUE(poly.holes.empty());
    EXPECT_EQ(poly.exterior.size(), 4); // collinear vertices are removed.
    EXPECT_EQ(rnaflux::signed_area(poly.exterior), 6); // counter-clockwise.

    // Pixels are centered on their indices.
    auto box = rnaflux::bounds(poly);
    EXPECT_EQ(box.xmin, -0.5);
    EXPECT_EQ(box.xmax, 2.5);
    EXPECT_EQ(box.ymin, -0.5);
    EXPECT_EQ(box.ymax, 1.5);
}

TEST(TraceLabelImage, Hole) {
    LabelImage img;
    for (int i = 0; i < 5; ++i) {
        for (int j = 0; j < 5; ++j) {
            img.add(i, j, (i == 2 && j == 2) ? 2 : 1);
        }
    }

    auto res = img.trace();
    ASSERT_EQ(res.labels.size(), 2);

    const auto& outer = res.shapes[0];
    ASSERT_EQ(outer.size(), 1);
    ASSERT_EQ(outer[0].holes.size(), 1);
    EXPECT_LT(rnaflux::signed_area(outer[0].holes[0]), 0); // clockwise.
    EXPECT_EQ(rnaflux::area(outer), 24);

    const auto& inner = res.shapes[1];
    ASSERT_EQ(inner.size(), 1);
    EXPECT_EQ(rnaflux::area(inner), 1);

    EXPECT_FALSE(rnaflux::covers(outer, rnaflux::Point(2, 2)));
    EXPECT_TRUE(rnaflux::covers(inner, rnaflux::Point(2, 2)));
}

TEST(TraceLabelImage, Checkerboard) {
    // 2x2 blocks alternating between labels 1 and 2, on an 8x8 grid.
    LabelImage img;
    int expected[2] = { 0, 0 };
    for (int i = 0; i < 8; ++i) {
        for (int j = 0; j < 8; ++j) {
            int lab = ((i / 2 + j / 2) % 2) + 1;
            img.add(i, j, lab);
            ++expected[lab - 1];
        }
    }

    auto res = img.trace();
    ASSERT_EQ(res.labels.size(), 2);
    for (int l = 0; l < 2; ++l) {
        EXPECT_EQ(rnaflux::area(res.shapes[l]), expected[l]);

        // Blocks touching at corners are not 4-connected, so each block is its own polygon.
        EXPECT_EQ(res.shapes[l].size(), 8);
    }

    // Every pixel center is covered by the polygons of its own label only.
    for (size_t p = 0; p < img.x.size(); ++p) {
        rnaflux::Point center(img.x[p], img.y[p]);
        int lab = img.labels[p];
        EXPECT_TRUE(rnaflux::covers(res.shapes[lab - 1], center));
        EXPECT_FALSE(rnaflux::covers(res.shapes[2 - lab], center));
    }
}

TEST(TraceLabelImage, BackgroundAndOffsets) {
    LabelImage img;
    img.add(-10, 5, 3);
    img.add(-9, 5, 3);
    img.add(-8, 5, 0);
    img.add(-7, 5, 3);

    auto res = img.trace();
    ASSERT_EQ(res.labels.size(), 1);
    EXPECT_EQ(res.labels[0], 3);
    EXPECT_EQ(res.shapes[0].size(), 2);
    EXPECT_EQ(rnaflux::area(res.shapes[0]), 3);
}

TEST(TraceLabelImage, Empty) {
    LabelImage img;
    auto res = img.trace();
    EXPECT_TRUE(res.labels.empty());
    EXPECT_TRUE(res.shapes.empty());
}

TEST(TraceLabelImage, TooLarge) {
    LabelImage img;
    img.add(0, 0, 1);
    img.add(9, 9, 2);

    rnaflux::TraceLabelImage tracer;
    tracer.set_max_pixels(99);
    EXPECT_ANY_THROW(tracer.run(img.x.size(), img.x.data(), img.y.data(), img.labels.data()));

    tracer.set_max_pixels(100);
    auto res = tracer.run(img.x.size(), img.x.data(), img.y.data(), img.labels.data());
    ASSERT_EQ(res.labels.size(), 2);
    EXPECT_EQ(rnaflux::area(res.shapes[0]), 1);
    EXPECT_EQ(rnaflux::area(res.shapes[1]), 1);

    // Coordinates spanning most of the index range do not overflow the size check.
    LabelImage wide;
    wide.add(-2000000000, 0, 1);
    wide.add(2000000000, 0, 1);
    EXPECT_ANY_THROW(wide.trace());
}
