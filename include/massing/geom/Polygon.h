#pragma once

#include "massing/geom/Point.h"
#include "massing/geom/GeomUtils.h"
#include <functional>
#include <initializer_list>
#include <vector>

namespace massing {
namespace geom {

/**
 * Rectangle - Simple axis-aligned bounding rectangle
 */
struct Rectangle {
    double left, top, right, bottom;

    Rectangle() : left(0), top(0), right(0), bottom(0) {}
    Rectangle(double x, double y) : left(x), top(y), right(x), bottom(y) {}

    double width() const { return right - left; }
    double height() const { return bottom - top; }
};

/**
 * Polygon - simple ring of vertices, stored open (no repeated closing vertex).
 * Footprints are immutable once built, so the polygon owns its points by value.
 */
class Polygon {
public:
    Polygon() = default;

    explicit Polygon(std::vector<Point> vertices) : vertices_(std::move(vertices)) {}

    Polygon(std::initializer_list<Point> init) : vertices_(init) {}

    bool operator==(const Polygon& other) const { return vertices_ == other.vertices_; }
    bool operator!=(const Polygon& other) const { return !(*this == other); }

    size_t size() const { return vertices_.size(); }
    bool empty() const { return vertices_.empty(); }

    const Point& operator[](size_t i) const { return vertices_[i]; }
    const std::vector<Point>& vertices() const { return vertices_; }

    // Edge i runs from vertex i to vertex i+1 (wrapping)
    Point edgeStart(size_t i) const { return vertices_[i]; }
    Point edgeEnd(size_t i) const { return vertices_[(i + 1) % vertices_.size()]; }
    Point vectori(size_t i) const { return edgeEnd(i).subtract(edgeStart(i)); }

    // Signed area, positive for counter-clockwise rings
    double square() const { return GeomUtils::signedArea(vertices_); }

    double area() const;
    double perimeter() const;
    Point centroid() const;
    Rectangle getBounds() const;

    bool isCounterClockwise() const { return square() > 0; }
    bool isConvex() const;

    // No two non-adjacent edges touch
    bool isSimple() const;

    bool contains(const Point& p, bool excludeBoundary = false) const {
        return GeomUtils::containsPoint(vertices_, p, excludeBoundary);
    }

    void forEdge(const std::function<void(const Point&, const Point&)>& f) const {
        size_t len = vertices_.size();
        for (size_t i = 0; i < len; ++i) {
            f(vertices_[i], vertices_[(i + 1) % len]);
        }
    }

    Polygon reversed() const;

    // Rotate all vertices around `pivot` by angle in radians
    Polygon rotated(double a, const Point& pivot) const;

    // Copy with a counter-clockwise ring
    Polygon counterClockwise() const {
        return isCounterClockwise() ? *this : reversed();
    }

private:
    std::vector<Point> vertices_;
};

} // namespace geom
} // namespace massing
