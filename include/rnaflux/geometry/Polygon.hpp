#ifndef RNAFLUX_POLYGON_HPP
#define RNAFLUX_POLYGON_HPP

#include <vector>
#include <cmath>
#include <limits>
#include <algorithm>

/**
 * @file Polygon.hpp
 *
 * @brief Planar polygon primitives.
 */

namespace rnaflux {

/**
 * @brief A point in the plane.
 */
struct Point {
    Point() = default;

    Point(double x_, double y_) : x(x_), y(y_) {}

    double x = 0;

    double y = 0;
};

inline bool operator==(const Point& left, const Point& right) {
    return left.x == right.x && left.y == right.y;
}

/**
 * A ring is a closed sequence of vertices.
 * The closing vertex is implicit, i.e., the first vertex is not repeated at the end.
 */
typedef std::vector<Point> Ring;

/**
 * @brief Axis-aligned bounding box.
 */
struct Bounds {
    double xmin = std::numeric_limits<double>::infinity();
    double ymin = std::numeric_limits<double>::infinity();
    double xmax = -std::numeric_limits<double>::infinity();
    double ymax = -std::numeric_limits<double>::infinity();

    /**
     * @return Whether no points have been added to the box.
     */
    bool empty() const {
        return xmin > xmax;
    }

    void add(const Point& p) {
        xmin = std::min(xmin, p.x);
        ymin = std::min(ymin, p.y);
        xmax = std::max(xmax, p.x);
        ymax = std::max(ymax, p.y);
    }
};

/**
 * @brief A polygon with an exterior ring and zero or more holes.
 *
 * Exterior rings are stored counter-clockwise and holes clockwise when produced by **rnaflux**,
 * but all functions here accept either orientation.
 */
struct Polygon {
    Polygon() = default;

    Polygon(Ring e, std::vector<Ring> h = {}) : exterior(std::move(e)), holes(std::move(h)) {}

    Ring exterior;

    std::vector<Ring> holes;

    /**
     * @return Whether the polygon has no exterior ring.
     */
    bool empty() const {
        return exterior.size() < 3;
    }
};

/**
 * @brief A collection of disjoint polygons.
 *
 * An empty `MultiPolygon` is used as the placeholder geometry for cells without any domain of a given label.
 */
typedef std::vector<Polygon> MultiPolygon;

/**
 * @param ring A ring of vertices.
 * @return Signed area of the ring, positive for counter-clockwise orientation.
 */
inline double signed_area(const Ring& ring) {
    size_t n = ring.size();
    if (n < 3) {
        return 0;
    }

    double total = 0;
    for (size_t i = 0; i < n; ++i) {
        const auto& a = ring[i];
        const auto& b = ring[(i + 1) % n];
        total += a.x * b.y - b.x * a.y;
    }
    return total / 2;
}

/**
 * @param poly A polygon.
 * @return Area of the polygon after subtracting its holes.
 */
inline double area(const Polygon& poly) {
    double output = std::abs(signed_area(poly.exterior));
    for (const auto& h : poly.holes) {
        output -= std::abs(signed_area(h));
    }
    return output;
}

inline double area(const MultiPolygon& multi) {
    double output = 0;
    for (const auto& p : multi) {
        output += area(p);
    }
    return output;
}

inline Bounds bounds(const Ring& ring) {
    Bounds output;
    for (const auto& p : ring) {
        output.add(p);
    }
    return output;
}

inline Bounds bounds(const Polygon& poly) {
    return bounds(poly.exterior);
}

inline Bounds bounds(const MultiPolygon& multi) {
    Bounds output;
    for (const auto& p : multi) {
        for (const auto& v : p.exterior) {
            output.add(v);
        }
    }
    return output;
}

/**
 * @param ring A ring of vertices.
 * @return Centroid of the area enclosed by `ring`.
 * For degenerate rings with zero area, the mean of the vertices is returned instead.
 */
inline Point centroid(const Ring& ring) {
    size_t n = ring.size();
    if (n == 0) {
        return Point(std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::quiet_NaN());
    }

    double cx = 0, cy = 0, twice_area = 0;
    for (size_t i = 0; i < n; ++i) {
        const auto& a = ring[i];
        const auto& b = ring[(i + 1) % n];
        double cross = a.x * b.y - b.x * a.y;
        twice_area += cross;
        cx += (a.x + b.x) * cross;
        cy += (a.y + b.y) * cross;
    }

    if (twice_area == 0) {
        double mx = 0, my = 0;
        for (const auto& p : ring) {
            mx += p.x;
            my += p.y;
        }
        return Point(mx / n, my / n);
    }

    return Point(cx / (3 * twice_area), cy / (3 * twice_area));
}

inline Point centroid(const Polygon& poly) {
    return centroid(poly.exterior);
}

namespace geometry_internal {

inline bool on_segment(const Point& p, const Point& a, const Point& b) {
    double cross = (b.x - a.x) * (p.y - a.y) - (b.y - a.y) * (p.x - a.x);
    double scale = std::max({ std::abs(b.x - a.x), std::abs(b.y - a.y), 1.0 });
    if (std::abs(cross) > 1e-12 * scale * scale) {
        return false;
    }
    return p.x >= std::min(a.x, b.x) && p.x <= std::max(a.x, b.x) && p.y >= std::min(a.y, b.y) && p.y <= std::max(a.y, b.y);
}

// 0 = outside, 1 = on the boundary, 2 = strictly inside.
inline int locate(const Point& p, const Ring& ring) {
    size_t n = ring.size();
    if (n < 3) {
        return 0;
    }

    bool inside = false;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const auto& a = ring[i];
        const auto& b = ring[j];
        if (on_segment(p, a, b)) {
            return 1;
        }
        if ((a.y > p.y) != (b.y > p.y)) {
            double xcross = (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x;
            if (p.x < xcross) {
                inside = !inside;
            }
        }
    }

    return inside ? 2 : 0;
}

}

/**
 * @param p A point.
 * @param ring A ring of vertices.
 * @return Whether `p` lies inside or on the boundary of `ring`.
 */
inline bool covers(const Ring& ring, const Point& p) {
    return geometry_internal::locate(p, ring) > 0;
}

/**
 * @param poly A polygon.
 * @param p A point.
 * @return Whether `p` lies inside or on the boundary of `poly`.
 * Points strictly inside a hole are not covered, but points on the boundary of a hole are.
 */
inline bool covers(const Polygon& poly, const Point& p) {
    if (!covers(poly.exterior, p)) {
        return false;
    }
    for (const auto& h : poly.holes) {
        if (geometry_internal::locate(p, h) == 2) {
            return false;
        }
    }
    return true;
}

inline bool covers(const MultiPolygon& multi, const Point& p) {
    for (const auto& poly : multi) {
        if (covers(poly, p)) {
            return true;
        }
    }
    return false;
}

/**
 * Scale all coordinates about the origin.
 *
 * @param poly A polygon, modified in place.
 * @param factor Scaling factor for both axes.
 */
inline void scale(Polygon& poly, double factor) {
    for (auto& v : poly.exterior) {
        v.x *= factor;
        v.y *= factor;
    }
    for (auto& h : poly.holes) {
        for (auto& v : h) {
            v.x *= factor;
            v.y *= factor;
        }
    }
}

inline void scale(MultiPolygon& multi, double factor) {
    for (auto& p : multi) {
        scale(p, factor);
    }
}

/**
 * Radius of a polygon, defined as the mean distance from its centroid to the vertices of its exterior ring.
 *
 * @param poly A polygon.
 * @return The radius, or NaN if `poly` is empty.
 */
inline double radius(const Polygon& poly) {
    if (poly.exterior.empty()) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    auto center = centroid(poly);
    double total = 0;
    for (const auto& v : poly.exterior) {
        total += std::hypot(v.x - center.x, v.y - center.y);
    }
    return total / poly.exterior.size();
}

}

#endif
