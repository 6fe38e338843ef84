#pragma once

#include "massing/geom/Point.h"
#include <optional>
#include <vector>

namespace massing {
namespace geom {

/**
 * Minimum-area enclosing rectangle of a point set.
 * `axis` is the unit direction of the `length` side; length >= width.
 */
struct OrientedBox {
    Point origin;      // corner with the smallest projections on axis/normal
    Point axis;
    double length = 0.0;
    double width = 0.0;

    double area() const { return length * width; }
};

/**
 * GeomUtils - Static geometry helpers shared by the footprint code
 */
class GeomUtils {
public:
    static constexpr double EPSILON = 1e-9;

    /**
     * Find intersection of two lines defined by point + direction vector
     * Returns parametric t values (t1, t2) as a Point, or nullopt if parallel
     */
    static std::optional<Point> intersectLines(
        double x1, double y1, double dx1, double dy1,
        double x2, double y2, double dx2, double dy2
    ) {
        double d = dx1 * dy2 - dy1 * dx2;
        if (d == 0) {
            return std::nullopt;
        }

        double t2 = (dy1 * (x2 - x1) - dx1 * (y2 - y1)) / d;
        double t1;
        if (dx1 != 0) {
            t1 = (x2 - x1 + dx2 * t2) / dx1;
        } else {
            t1 = (y2 - y1 + dy2 * t2) / dy1;
        }

        return Point(t1, t2);
    }

    static Point lerp(const Point& p1, const Point& p2, double t = 0.5) {
        return Point(p1.x + (p2.x - p1.x) * t, p1.y + (p2.y - p1.y) * t);
    }

    static double cross(double x1, double y1, double x2, double y2) {
        return x1 * y2 - y1 * x2;
    }

    /**
     * Signed area of triangle formed by three points
     * Positive if CCW, negative if CW
     */
    static double triangleArea(const Point& p0, const Point& p1, const Point& p2) {
        return 0.5 * ((p1.x - p0.x) * (p2.y - p0.y) - (p2.x - p0.x) * (p1.y - p0.y));
    }

    // Signed shoelace area, positive for CCW rings
    static double signedArea(const std::vector<Point>& poly);

    static bool containsPoint(const std::vector<Point>& poly, const Point& p, bool excludeBoundary = false);

    // True if p lies on segment [a, b] within `tolerance` metres
    static bool pointOnSegment(const Point& p, const Point& a, const Point& b, double tolerance = 1e-6);

    // Proper or touching intersection of segments [a1, a2] and [b1, b2]
    static bool segmentsIntersect(const Point& a1, const Point& a2, const Point& b1, const Point& b2);

    /**
     * Keep the part of `poly` on the inner side of a directed line.
     * A point p is kept when normal . (p - linePoint) >= offset.
     * Sutherland-Hodgman step; exact for convex subjects.
     */
    static std::vector<Point> clipHalfPlane(
        const std::vector<Point>& poly,
        const Point& linePoint,
        const Point& normal,
        double offset
    );

    /**
     * Clip `subject` by a convex CCW `clip` polygon.
     * The subject may be concave; disconnected parts come back joined by
     * zero-area bridges along the clip boundary, so the area stays exact.
     */
    static std::vector<Point> clipConvex(const std::vector<Point>& subject, const std::vector<Point>& clip);

    /**
     * Shrink polygon edges inward by varying amounts (mitred joins)
     *
     * @param poly CCW polygon to shrink
     * @param amounts Shrink amounts for each edge i = (poly[i], poly[i+1])
     * @return The shrunk polygon; may be inverted when amounts are too large
     */
    static std::vector<Point> shrink(const std::vector<Point>& poly, const std::vector<double>& amounts);

    // Andrew's monotone chain; CCW, no collinear points
    static std::vector<Point> convexHull(std::vector<Point> points);

    // Rotating calipers over the hull edges
    static OrientedBox minAreaRect(const std::vector<Point>& poly);

    // Smallest caliper width of the point set
    static double minimumWidth(const std::vector<Point>& poly);

    /**
     * Smallest inward depth of a CCW polygon: a ray is cast from the middle
     * of every edge along its inward normal, and the nearest hit on another
     * edge is kept. Catches the thin legs of concave footprints that the
     * caliper width of the hull misses.
     */
    static double minimumInteriorDepth(const std::vector<Point>& poly);

    // Drop repeated and collinear vertices
    static std::vector<Point> simplify(const std::vector<Point>& poly, double epsilon = 1e-7);
};

} // namespace geom
} // namespace massing
