#include "massing/geom/GeomUtils.h"
#include <algorithm>
#include <cmath>
#include <limits>

namespace massing {
namespace geom {

double GeomUtils::signedArea(const std::vector<Point>& poly) {
    if (poly.size() < 3) return 0.0;

    double s = 0.0;
    size_t n = poly.size();
    for (size_t i = 0; i < n; ++i) {
        const Point& v1 = poly[i];
        const Point& v2 = poly[(i + 1) % n];
        s += v1.x * v2.y - v2.x * v1.y;
    }
    return s * 0.5;
}

bool GeomUtils::containsPoint(const std::vector<Point>& poly, const Point& p, bool excludeBoundary) {
    // Ray casting algorithm for point-in-polygon test
    if (poly.size() < 3) return false;

    int crossings = 0;
    size_t n = poly.size();

    for (size_t i = 0; i < n; ++i) {
        const Point& p1 = poly[i];
        const Point& p2 = poly[(i + 1) % n];

        if (pointOnSegment(p, p1, p2, 1e-9)) {
            return !excludeBoundary;
        }

        if ((p1.y <= p.y && p2.y > p.y) || (p2.y <= p.y && p1.y > p.y)) {
            double vt = (p.y - p1.y) / (p2.y - p1.y);
            if (p.x < p1.x + vt * (p2.x - p1.x)) {
                ++crossings;
            }
        }
    }

    return (crossings % 2) == 1;
}

bool GeomUtils::pointOnSegment(const Point& p, const Point& a, const Point& b, double tolerance) {
    Point ab = b.subtract(a);
    double lenSq = ab.dot(ab);
    if (lenSq < EPSILON) {
        return Point::distance(p, a) <= tolerance;
    }

    double t = p.subtract(a).dot(ab) / lenSq;
    double slack = tolerance / std::sqrt(lenSq);
    if (t < -slack || t > 1.0 + slack) return false;

    t = std::clamp(t, 0.0, 1.0);
    Point proj = lerp(a, b, t);
    return Point::distance(p, proj) <= tolerance;
}

bool GeomUtils::segmentsIntersect(const Point& a1, const Point& a2, const Point& b1, const Point& b2) {
    auto orient = [](const Point& p, const Point& q, const Point& r) {
        double v = (q.x - p.x) * (r.y - p.y) - (q.y - p.y) * (r.x - p.x);
        if (std::abs(v) < EPSILON) return 0;
        return v > 0 ? 1 : -1;
    };

    int o1 = orient(a1, a2, b1);
    int o2 = orient(a1, a2, b2);
    int o3 = orient(b1, b2, a1);
    int o4 = orient(b1, b2, a2);

    if (o1 != o2 && o3 != o4) return true;

    // Collinear cases
    if (o1 == 0 && pointOnSegment(b1, a1, a2, 1e-9)) return true;
    if (o2 == 0 && pointOnSegment(b2, a1, a2, 1e-9)) return true;
    if (o3 == 0 && pointOnSegment(a1, b1, b2, 1e-9)) return true;
    if (o4 == 0 && pointOnSegment(a2, b1, b2, 1e-9)) return true;
    return false;
}

std::vector<Point> GeomUtils::clipHalfPlane(
    const std::vector<Point>& poly,
    const Point& linePoint,
    const Point& normal,
    double offset
) {
    std::vector<Point> result;
    size_t n = poly.size();
    if (n == 0) return result;
    result.reserve(n + 1);

    auto dist = [&](const Point& p) {
        return normal.dot(p.subtract(linePoint)) - offset;
    };

    for (size_t i = 0; i < n; ++i) {
        const Point& cur = poly[i];
        const Point& next = poly[(i + 1) % n];
        double dCur = dist(cur);
        double dNext = dist(next);
        bool curInside = dCur >= -EPSILON;
        bool nextInside = dNext >= -EPSILON;

        if (curInside) {
            result.push_back(cur);
        }
        if (curInside != nextInside) {
            double t = dCur / (dCur - dNext);
            result.push_back(lerp(cur, next, t));
        }
    }

    if (result.size() < 3) {
        result.clear();
    }
    return result;
}

std::vector<Point> GeomUtils::clipConvex(const std::vector<Point>& subject, const std::vector<Point>& clip) {
    std::vector<Point> result = subject;
    size_t n = clip.size();

    for (size_t i = 0; i < n && !result.empty(); ++i) {
        const Point& c0 = clip[i];
        const Point& c1 = clip[(i + 1) % n];
        Point edge = c1.subtract(c0);
        if (edge.length() < EPSILON) continue;

        // Interior of a CCW ring is on the left of each edge
        result = clipHalfPlane(result, c0, edge.norm().rotate90(), 0.0);
    }

    return simplify(result);
}

std::vector<Point> GeomUtils::shrink(const std::vector<Point>& poly, const std::vector<double>& amounts) {
    // Shrinks each edge inward by the specified amount.
    // Uses inward normal vectors and computes new vertices at intersections

    if (poly.size() < 3 || amounts.size() != poly.size()) {
        return poly;
    }

    size_t n = poly.size();
    std::vector<Point> result;
    result.reserve(n);

    for (size_t i = 0; i < n; ++i) {
        size_t prevIdx = (i + n - 1) % n;
        size_t nextIdx = (i + 1) % n;

        const Point& prev = poly[prevIdx];
        const Point& curr = poly[i];
        const Point& next = poly[nextIdx];

        Point prevEdge = curr.subtract(prev);
        double prevLen = prevEdge.length();

        Point currEdge = next.subtract(curr);
        double currLen = currEdge.length();

        if (prevLen < EPSILON || currLen < EPSILON) {
            result.push_back(curr);
            continue;
        }

        // Inward normals (CCW winding)
        Point prevNorm(-prevEdge.y / prevLen, prevEdge.x / prevLen);
        Point currNorm(-currEdge.y / currLen, currEdge.x / currLen);

        double prevAmount = amounts[prevIdx];
        double currAmount = amounts[i];

        Point prevOffsetStart = prev.add(prevNorm.scale(prevAmount));
        Point currOffsetStart = curr.add(currNorm.scale(currAmount));

        // Collinear neighbours (a split edge) count as parallel
        std::optional<Point> intersection;
        if (std::abs(cross(prevNorm.x, prevNorm.y, currNorm.x, currNorm.y)) > EPSILON) {
            intersection = intersectLines(
                prevOffsetStart.x, prevOffsetStart.y,
                prevEdge.x, prevEdge.y,
                currOffsetStart.x, currOffsetStart.y,
                currEdge.x, currEdge.y
            );
        }

        if (intersection) {
            double t = intersection->x;
            result.push_back(prevOffsetStart.add(prevEdge.scale(t)));
        } else {
            // Parallel edges - use average offset
            result.push_back(curr.add(prevNorm.scale(prevAmount).add(currNorm.scale(currAmount)).scale(0.5)));
        }
    }

    return result;
}

std::vector<Point> GeomUtils::convexHull(std::vector<Point> points) {
    if (points.size() < 3) return points;

    std::sort(points.begin(), points.end(), [](const Point& a, const Point& b) {
        return a.x < b.x || (a.x == b.x && a.y < b.y);
    });

    std::vector<Point> hull(points.size() * 2);
    size_t k = 0;

    // Lower hull
    for (size_t i = 0; i < points.size(); ++i) {
        while (k >= 2 && triangleArea(hull[k - 2], hull[k - 1], points[i]) <= EPSILON) --k;
        hull[k++] = points[i];
    }

    // Upper hull
    for (size_t i = points.size() - 1, t = k + 1; i > 0; --i) {
        while (k >= t && triangleArea(hull[k - 2], hull[k - 1], points[i - 1]) <= EPSILON) --k;
        hull[k++] = points[i - 1];
    }

    hull.resize(k > 0 ? k - 1 : 0);
    return hull;
}

OrientedBox GeomUtils::minAreaRect(const std::vector<Point>& poly) {
    OrientedBox best;
    std::vector<Point> hull = convexHull(poly);
    if (hull.size() < 3) return best;

    double bestArea = std::numeric_limits<double>::max();
    size_t n = hull.size();

    for (size_t i = 0; i < n; ++i) {
        Point edge = hull[(i + 1) % n].subtract(hull[i]);
        if (edge.length() < EPSILON) continue;

        Point dir = edge.norm();
        Point perp = dir.rotate90();

        double minA = std::numeric_limits<double>::max();
        double maxA = std::numeric_limits<double>::lowest();
        double minP = std::numeric_limits<double>::max();
        double maxP = std::numeric_limits<double>::lowest();

        for (const auto& p : hull) {
            double a = dir.dot(p);
            double b = perp.dot(p);
            minA = std::min(minA, a);
            maxA = std::max(maxA, a);
            minP = std::min(minP, b);
            maxP = std::max(maxP, b);
        }

        double area = (maxA - minA) * (maxP - minP);
        if (area < bestArea - EPSILON) {
            bestArea = area;
            best.origin = dir.scale(minA).add(perp.scale(minP));
            if (maxA - minA >= maxP - minP) {
                best.axis = dir;
                best.length = maxA - minA;
                best.width = maxP - minP;
            } else {
                best.axis = perp;
                best.length = maxP - minP;
                best.width = maxA - minA;
            }
        }
    }

    return best;
}

double GeomUtils::minimumWidth(const std::vector<Point>& poly) {
    std::vector<Point> hull = convexHull(poly);
    if (hull.size() < 3) return 0.0;

    double best = std::numeric_limits<double>::max();
    size_t n = hull.size();

    for (size_t i = 0; i < n; ++i) {
        const Point& a = hull[i];
        Point edge = hull[(i + 1) % n].subtract(a);
        double len = edge.length();
        if (len < EPSILON) continue;

        double farthest = 0.0;
        for (const auto& p : hull) {
            farthest = std::max(farthest, std::abs(edge.cross(p.subtract(a))) / len);
        }
        best = std::min(best, farthest);
    }

    return best;
}

double GeomUtils::minimumInteriorDepth(const std::vector<Point>& poly) {
    size_t n = poly.size();
    if (n < 3) return 0.0;

    double best = std::numeric_limits<double>::max();
    for (size_t i = 0; i < n; ++i) {
        const Point& a = poly[i];
        Point edge = poly[(i + 1) % n].subtract(a);
        if (edge.length() < EPSILON) continue;

        Point origin = Point::midpoint(a, poly[(i + 1) % n]);
        Point dir = edge.norm().rotate90();

        for (size_t j = 0; j < n; ++j) {
            if (j == i) continue;
            const Point& b0 = poly[j];
            Point seg = poly[(j + 1) % n].subtract(b0);

            double denom = dir.cross(seg);
            if (std::abs(denom) < EPSILON) continue;

            Point rel = b0.subtract(origin);
            double t = rel.cross(seg) / denom;
            double s = rel.cross(dir) / denom;
            if (t > EPSILON && s >= -EPSILON && s <= 1.0 + EPSILON) {
                best = std::min(best, t);
            }
        }
    }

    return best == std::numeric_limits<double>::max() ? 0.0 : best;
}

std::vector<Point> GeomUtils::simplify(const std::vector<Point>& poly, double epsilon) {
    std::vector<Point> pts = poly;
    bool changed = true;

    while (changed && pts.size() >= 3) {
        changed = false;
        size_t n = pts.size();
        for (size_t i = 0; i < n; ++i) {
            const Point& prev = pts[(i + n - 1) % n];
            const Point& curr = pts[i];
            const Point& next = pts[(i + 1) % n];

            bool duplicate = Point::distance(prev, curr) < epsilon;
            bool collinear = std::abs(triangleArea(prev, curr, next)) < epsilon;
            if (duplicate || collinear) {
                pts.erase(pts.begin() + static_cast<long>(i));
                changed = true;
                break;
            }
        }
    }

    if (pts.size() < 3) pts.clear();
    return pts;
}

} // namespace geom
} // namespace massing
