#ifndef RNAFLUX_TRACE_LABEL_IMAGE_HPP
#define RNAFLUX_TRACE_LABEL_IMAGE_HPP

#include <vector>
#include <map>
#include <array>
#include <algorithm>
#include <stdexcept>
#include <string>

#include "Polygon.hpp"

/**
 * @file TraceLabelImage.hpp
 *
 * @brief Convert an integer label image into polygons.
 */

namespace rnaflux {

/**
 * @brief Convert an integer label image into polygons.
 *
 * The image is supplied as a set of labelled pixels at integer grid positions, where pixel `(i, j)` covers the unit square centered at `(i, j)`.
 * Unlisted positions and pixels with a label of zero are treated as background.
 * For each non-zero label, we identify the 4-connected regions of pixels with that label and trace their boundaries.
 * Each region becomes a `Polygon` whose exterior ring is counter-clockwise and whose holes are clockwise;
 * all regions for the same label are then combined into a single `MultiPolygon`.
 *
 * Ring vertices only occur at corners, i.e., collinear vertices along a straight run of pixel edges are removed.
 * Regions touching only at a corner are kept separate, consistent with the 4-connectivity.
 */
class TraceLabelImage {
public:
    /**
     * @brief Default parameter settings.
     */
    struct Defaults {
        /**
         * See `set_max_pixels()` for details.
         */
        static constexpr size_t max_pixels = 100000000;
    };

private:
    size_t max_pixels = Defaults::max_pixels;

public:
    /**
     * @param m Maximum number of pixels in the bounding box of the image.
     * The image is stored densely, so larger images raise an error instead.
     *
     * @return A reference to this `TraceLabelImage` object.
     */
    TraceLabelImage& set_max_pixels(size_t m = Defaults::max_pixels) {
        max_pixels = m;
        return *this;
    }

    /**
     * @brief Traced polygons for each label.
     */
    struct Results {
        /**
         * Sorted vector of distinct non-zero labels in the image.
         */
        std::vector<int> labels;

        /**
         * Polygons for each label in `labels`, in grid units.
         */
        std::vector<MultiPolygon> shapes;
    };

private:
    // Directions, in counter-clockwise order: east, north, west, south.
    static constexpr int dx[4] = { 1, 0, -1, 0 };
    static constexpr int dy[4] = { 0, 1, 0, -1 };

    typedef std::array<long long, 3> EdgeKey; // start x, start y, direction.

    struct Image {
        long long xmin = 0, ymin = 0;
        long long width = 0, height = 0;
        std::vector<int> values;

        int get(long long x, long long y) const {
            x -= xmin;
            y -= ymin;
            if (x < 0 || y < 0 || x >= width || y >= height) {
                return 0;
            }
            return values[y * width + x];
        }
    };

    static void trace_component(const std::vector<long long>& members, const Image& image, const std::vector<int>& component, int self, MultiPolygon& output) {
        auto same = [&](long long x, long long y) -> bool {
            long long rx = x - image.xmin, ry = y - image.ymin;
            if (rx < 0 || ry < 0 || rx >= image.width || ry >= image.height) {
                return false;
            }
            return component[ry * image.width + rx] == self;
        };

        // Vertex (x, y) is the lower-left corner of pixel (x, y).
        std::map<EdgeKey, char> edges;
        for (auto m : members) {
            long long x = m % image.width + image.xmin;
            long long y = m / image.width + image.ymin;

            if (!same(x, y - 1)) {
                edges[EdgeKey{ x, y, 0 }] = 0;
            }
            if (!same(x + 1, y)) {
                edges[EdgeKey{ x + 1, y, 1 }] = 0;
            }
            if (!same(x, y + 1)) {
                edges[EdgeKey{ x + 1, y + 1, 2 }] = 0;
            }
            if (!same(x - 1, y)) {
                edges[EdgeKey{ x, y + 1, 3 }] = 0;
            }
        }

        std::vector<Ring> outers, holes;
        for (auto& e : edges) {
            if (e.second) {
                continue;
            }

            Ring ring;
            auto start = e.first;
            auto current = start;
            while (1) {
                edges[current] = 1;
                long long nx = current[0] + dx[current[2]];
                long long ny = current[1] + dy[current[2]];

                // Left turn first, then straight, then right, so that diagonal neighbors are separated.
                EdgeKey next{ 0, 0, -1 };
                for (int turn : { 1, 0, 3 }) {
                    EdgeKey candidate{ nx, ny, (current[2] + turn) % 4 };
                    if (edges.find(candidate) != edges.end()) {
                        next = candidate;
                        break;
                    }
                }

                if (next[2] < 0) {
                    throw std::runtime_error("failed to close a ring while tracing the label image");
                }
                if (next[2] != current[2]) {
                    ring.emplace_back(nx - 0.5, ny - 0.5);
                }
                if (next == start) {
                    break;
                }
                current = next;
            }

            if (signed_area(ring) > 0) {
                outers.push_back(std::move(ring));
            } else {
                holes.push_back(std::move(ring));
            }
        }

        if (outers.size() == 1) {
            output.emplace_back(std::move(outers.front()), std::move(holes));
            return;
        }

        // This shouldn't happen for a 4-connected region, but just in case.
        size_t first = output.size();
        for (auto& o : outers) {
            output.emplace_back(std::move(o));
        }
        for (auto& h : holes) {
            auto inside = centroid(h);
            for (size_t o = first; o < output.size(); ++o) {
                if (covers(output[o].exterior, inside)) {
                    output[o].holes.push_back(std::move(h));
                    break;
                }
            }
        }
    }

public:
    /**
     * @param n Number of pixels.
     * @param[in] x Pointer to an array of length `n`, containing the x-index of each pixel.
     * @param[in] y Pointer to an array of length `n`, containing the y-index of each pixel.
     * @param[in] labels Pointer to an array of length `n`, containing the label of each pixel.
     * If multiple pixels have the same position, the last label is used.
     *
     * @return Polygons for each non-zero label.
     */
    template<typename Index_, typename Label_>
    Results run(size_t n, const Index_* x, const Index_* y, const Label_* labels) const {
        Results output;
        if (n == 0) {
            return output;
        }

        Image image;
        long long xmax = x[0], ymax = y[0];
        image.xmin = x[0];
        image.ymin = y[0];
        for (size_t i = 1; i < n; ++i) {
            image.xmin = std::min(image.xmin, static_cast<long long>(x[i]));
            image.ymin = std::min(image.ymin, static_cast<long long>(y[i]));
            xmax = std::max(xmax, static_cast<long long>(x[i]));
            ymax = std::max(ymax, static_cast<long long>(y[i]));
        }

        image.width = xmax - image.xmin + 1;
        image.height = ymax - image.ymin + 1;
        if (static_cast<double>(image.width) * static_cast<double>(image.height) > static_cast<double>(max_pixels)) {
            throw std::runtime_error("label image of " + std::to_string(image.width) + " x " + std::to_string(image.height) + " pixels exceeds the maximum size");
        }
        image.values.resize(image.width * image.height);
        for (size_t i = 0; i < n; ++i) {
            image.values[(y[i] - image.ymin) * image.width + (x[i] - image.xmin)] = labels[i];
        }

        // Labelling 4-connected components.
        std::vector<int> component(image.values.size(), -1);
        std::vector<std::vector<long long> > members;
        std::vector<int> component_label;
        std::vector<long long> stack;

        for (long long p = 0, end = image.values.size(); p < end; ++p) {
            int lab = image.values[p];
            if (lab == 0 || component[p] >= 0) {
                continue;
            }

            int self = members.size();
            members.emplace_back();
            component_label.push_back(lab);
            auto& current = members.back();

            component[p] = self;
            stack.push_back(p);
            while (!stack.empty()) {
                auto q = stack.back();
                stack.pop_back();
                current.push_back(q);

                long long qx = q % image.width, qy = q / image.width;
                for (int d = 0; d < 4; ++d) {
                    long long nx = qx + dx[d], ny = qy + dy[d];
                    if (nx < 0 || ny < 0 || nx >= image.width || ny >= image.height) {
                        continue;
                    }
                    long long np = ny * image.width + nx;
                    if (component[np] < 0 && image.values[np] == lab) {
                        component[np] = self;
                        stack.push_back(np);
                    }
                }
            }
        }

        std::map<int, MultiPolygon> collected;
        for (size_t s = 0; s < members.size(); ++s) {
            trace_component(members[s], image, component, s, collected[component_label[s]]);
        }

        for (auto& c : collected) {
            output.labels.push_back(c.first);
            output.shapes.push_back(std::move(c.second));
        }
        return output;
    }
};

}

#endif
